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

#include <string.h>
#include "ckiso/iso9660.hh"
#include "ckiso/dirrecord.hh"

namespace ckiso
{
	DirRecord::DirRecord() : record_len_(0),extent_loc_(0),data_len_(0),
		is_directory_(false)
	{
		memset(timestamp_,0,sizeof(timestamp_));
	}

	DirRecord::DirRecord(const std::string &ident,ckcore::tuint32 extent_loc,
						 ckcore::tuint32 data_len,bool is_directory) :
		record_len_(calc_len(ident.length())),extent_loc_(extent_loc),
		data_len_(data_len),is_directory_(is_directory),ident_(ident)
	{
		memset(timestamp_,0,sizeof(timestamp_));
	}

	DirRecord::~DirRecord()
	{
	}

	void DirRecord::set_timestamp(const struct tm &time)
	{
		iso_make_dir_datetime(time,timestamp_);
	}

	/*
		Returns the length of a record holding an identifier of the specified
		length. Records are always of even length.
	*/
	unsigned char DirRecord::calc_len(size_t ident_len)
	{
		size_t len = DIRRECORD_BASE_LEN + ident_len;
		if (ident_len & 1)
			len++;

		return len > DIRRECORD_MAX_LEN ? 0 : (unsigned char)len;
	}

	/*
		Encodes the record into buffer. The identifiers "." and ".." are
		written as the single bytes 0x00 and 0x01. Returns the number of bytes
		written or 0 if the identifier does not fit in a record.
	*/
	unsigned char DirRecord::encode(unsigned char *buffer) const
	{
		if (ident_.empty() || ident_.length() > DIRRECORD_MAX_IDENT_LEN)
			return 0;

		unsigned char len = calc_len(ident_.length());
		memset(buffer,0,len);

		buffer[DIRRECORD_OFS_LEN] = len;
		write733(buffer + DIRRECORD_OFS_EXTENT_LOC,extent_loc_);
		write733(buffer + DIRRECORD_OFS_DATA_LEN,data_len_);
		memcpy(buffer + DIRRECORD_OFS_TIMESTAMP,timestamp_,sizeof(timestamp_));
		buffer[DIRRECORD_OFS_FILE_FLAGS] = is_directory_ ? DIRRECORD_FILEFLAG_DIRECTORY : 0;
		write723(buffer + DIRRECORD_OFS_VOLSEQ_NUM,1);
		buffer[DIRRECORD_OFS_IDENT_LEN] = (unsigned char)ident_.length();

		if (ident_ == ".")
			buffer[DIRRECORD_OFS_IDENT] = 0;
		else if (ident_ == "..")
		{
			buffer[DIRRECORD_OFS_IDENT_LEN] = 1;
			buffer[DIRRECORD_OFS_IDENT] = 1;
		}
		else
			memcpy(buffer + DIRRECORD_OFS_IDENT,ident_.c_str(),ident_.length());

		return len;
	}

	/*
		Decodes the record at the start of buffer, size is the number of bytes
		remaining in the current sector.
	*/
	DirRecord::DecodeResult DirRecord::decode(const unsigned char *buffer,size_t size)
	{
		if (size == 0 || buffer[DIRRECORD_OFS_LEN] == 0)
			return DECODE_END;

		if (size < DIRRECORD_OFS_IDENT)
			return DECODE_MALFORMED;

		size_t ident_len = buffer[DIRRECORD_OFS_IDENT_LEN];
		size_t len = buffer[DIRRECORD_OFS_LEN];
		if (ident_len == 0 || len < DIRRECORD_OFS_IDENT + ident_len || len > size)
			return DECODE_MALFORMED;

		const unsigned char *ident = buffer + DIRRECORD_OFS_IDENT;
		if (ident_len == 1 && ident[0] == 0)
		{
			ident_ = ".";
		}
		else if (ident_len == 1 && ident[0] == 1)
		{
			ident_ = "..";
		}
		else
		{
			for (size_t i = 0; i < ident_len; i++)
			{
				if (ident[i] < 0x20 || ident[i] > 0x7E)
					return DECODE_MALFORMED;
			}

			ident_.assign((const char *)ident,ident_len);
			if (ident_.length() > 2 && ident_.compare(ident_.length() - 2,2,";1") == 0)
				ident_.resize(ident_.length() - 2);
		}

		record_len_ = (unsigned char)len;
		extent_loc_ = read733(buffer + DIRRECORD_OFS_EXTENT_LOC);
		data_len_ = read733(buffer + DIRRECORD_OFS_DATA_LEN);
		is_directory_ = (buffer[DIRRECORD_OFS_FILE_FLAGS] & DIRRECORD_FILEFLAG_DIRECTORY) != 0;
		memcpy(timestamp_,buffer + DIRRECORD_OFS_TIMESTAMP,sizeof(timestamp_));
		return DECODE_OK;
	}

	bool DirRecord::is_self_or_parent() const
	{
		return ident_ == "." || ident_ == "..";
	}
};
