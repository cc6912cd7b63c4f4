/*
 * The ckIso library provides ISO9660 disc image functionality.
 * Copyright (C) 2006-2009 Christian Kindahl
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#define CKISO_VERSION				"0.1"

// Operation results.
#define RESULT_OK					0
#define RESULT_FAIL					1		// Read, write or seek failure.
#define RESULT_ACCESS_DENIED		2		// Source file or directory is not readable.
#define RESULT_NO_PVD				3		// No primary volume descriptor in the image.
#define RESULT_MALFORMED			4		// Corrupt directory record.
