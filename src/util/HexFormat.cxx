// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "HexFormat.hxx"

const char hex_digits[] = "0123456789abcdef";
