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
#include "ckiso/imagestore.hh"

namespace ckiso
{
	MemoryImageStore::MemoryImageStore()
	{
	}

	MemoryImageStore::~MemoryImageStore()
	{
	}

	bool MemoryImageStore::read_at(ckcore::tuint64 offset,void *buffer,ckcore::tuint32 count)
	{
		if (offset > data_.size() || count > data_.size() - offset)
			return false;

		if (count > 0)
			memcpy(buffer,&data_[(size_t)offset],count);

		return true;
	}

	bool MemoryImageStore::write_at(ckcore::tuint64 offset,void *buffer,ckcore::tuint32 count)
	{
		if (offset + count > data_.size())
			data_.resize((size_t)(offset + count),0);

		if (count > 0)
			memcpy(&data_[(size_t)offset],buffer,count);

		return true;
	}

	ckcore::tuint64 MemoryImageStore::size()
	{
		return data_.size();
	}

	std::vector<unsigned char> &MemoryImageStore::data()
	{
		return data_;
	}

	FileImageStore::FileImageStore(const ckcore::Path &file_path) :
		file_path_(file_path),file_(file_path),size_(0),open_(false)
	{
	}

	FileImageStore::~FileImageStore()
	{
		close();
	}

	/**
		Opens the image file. MODE_WRITE creates a new, empty image.
		@return true if the file was opened, false otherwise.
	*/
	bool FileImageStore::open(OpenMode mode)
	{
		if (open_)
			return false;

		if (mode == MODE_READ)
		{
			if (!ckcore::File::exist(file_path_))
				return false;

			if (!file_.open(ckcore::File::ckOPEN_READ))
				return false;

			size_ = ckcore::File::size(file_path_);
		}
		else
		{
			if (!file_.open(ckcore::File::ckOPEN_WRITE))
				return false;

			size_ = 0;
		}

		open_ = true;
		return true;
	}

	void FileImageStore::close()
	{
		if (open_)
		{
			file_.close();
			open_ = false;
		}
	}

	bool FileImageStore::read_at(ckcore::tuint64 offset,void *buffer,ckcore::tuint32 count)
	{
		if (!open_ || offset + count > size_)
			return false;

		if (file_.seek((ckcore::tint64)offset,ckcore::File::ckFILE_BEGIN) == -1)
			return false;

		unsigned char *ptr = (unsigned char *)buffer;
		while (count > 0)
		{
			ckcore::tint64 processed = file_.read(ptr,count);
			if (processed <= 0)
				return false;

			ptr += processed;
			count -= (ckcore::tuint32)processed;
		}

		return true;
	}

	/*
		Seeking past the end of the file and writing leaves a zero filled gap.
	*/
	bool FileImageStore::write_at(ckcore::tuint64 offset,void *buffer,ckcore::tuint32 count)
	{
		if (!open_)
			return false;

		if (file_.seek((ckcore::tint64)offset,ckcore::File::ckFILE_BEGIN) == -1)
			return false;

		unsigned char *ptr = (unsigned char *)buffer;
		ckcore::tuint32 remaining = count;
		while (remaining > 0)
		{
			ckcore::tint64 processed = file_.write(ptr,remaining);
			if (processed <= 0)
				return false;

			ptr += processed;
			remaining -= (ckcore::tuint32)processed;
		}

		if (offset + count > size_)
			size_ = offset + count;

		return true;
	}

	ckcore::tuint64 FileImageStore::size()
	{
		return size_;
	}
};
