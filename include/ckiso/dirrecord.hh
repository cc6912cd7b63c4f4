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
#include <time.h>
#include <string>
#include <ckcore/types.hh>

// Directory record layout (9.1).
#define DIRRECORD_OFS_LEN					0
#define DIRRECORD_OFS_EXT_ATTR_LEN			1
#define DIRRECORD_OFS_EXTENT_LOC			2			// 7.3.3.
#define DIRRECORD_OFS_DATA_LEN				10			// 7.3.3.
#define DIRRECORD_OFS_TIMESTAMP				18			// 7 bytes.
#define DIRRECORD_OFS_FILE_FLAGS			25
#define DIRRECORD_OFS_FILE_UNIT_SIZE		26
#define DIRRECORD_OFS_INTERLEAVE_GAP		27
#define DIRRECORD_OFS_VOLSEQ_NUM			28			// 7.2.3.
#define DIRRECORD_OFS_IDENT_LEN				32
#define DIRRECORD_OFS_IDENT					33

#define DIRRECORD_BASE_LEN					34
#define DIRRECORD_MAX_LEN					255
#define DIRRECORD_MAX_IDENT_LEN				220

namespace ckiso
{
	class DirRecord
	{
	public:
		enum DecodeResult
		{
			DECODE_OK,
			DECODE_END,
			DECODE_MALFORMED
		};

		unsigned char record_len_;
		ckcore::tuint32 extent_loc_;
		ckcore::tuint32 data_len_;
		bool is_directory_;
		std::string ident_;
		unsigned char timestamp_[7];

		DirRecord();
		DirRecord(const std::string &ident,ckcore::tuint32 extent_loc,
				  ckcore::tuint32 data_len,bool is_directory);
		~DirRecord();

		void set_timestamp(const struct tm &time);

		unsigned char encode(unsigned char *buffer) const;
		DecodeResult decode(const unsigned char *buffer,size_t size);

		bool is_self_or_parent() const;

		static unsigned char calc_len(size_t ident_len);
	};
};
