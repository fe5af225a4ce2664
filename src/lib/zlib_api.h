//===-- zlib_api.h - zlib adapter API -------------------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of gamedepot, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Type definitions and macros that are resolved to zlib or zlib-ng based on
///    the build option.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "config.h" // IWYU pragma: keep

#ifdef GAMEDEPOT_ZNG
#include <zlib-ng.h>

typedef zng_stream gdi_z_stream;
#define gdi_z_deflate zng_deflate
#define gdi_z_deflateBound zng_deflateBound
#define gdi_z_deflateEnd zng_deflateEnd
#define gdi_z_deflateInit zng_deflateInit
#define gdi_z_inflate zng_inflate
#define gdi_z_inflateEnd zng_inflateEnd
#define gdi_z_inflateInit zng_inflateInit

#else // def GAMEDEPOT_ZNG
#ifndef ZLIB_CONST
#define ZLIB_CONST
#endif // ndef ZLIB_CONST
#include <zlib.h>

typedef z_stream gdi_z_stream;
#define gdi_z_deflate deflate
#define gdi_z_deflateBound deflateBound
#define gdi_z_deflateEnd deflateEnd
#define gdi_z_deflateInit deflateInit
#define gdi_z_inflate inflate
#define gdi_z_inflateEnd inflateEnd
#define gdi_z_inflateInit inflateInit

#endif // def GAMEDEPOT_ZNG else
