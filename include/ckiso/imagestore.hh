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
#include <vector>
#include <ckcore/types.hh>
#include <ckcore/file.hh>
#include <ckcore/path.hh>

namespace ckiso
{
	/**
		Random access byte store holding a disc image. Reads must be satisfied
		in full, writes beyond the current end extend the store and leave any
		gap zero filled.
	*/
	class ImageStore
	{
	public:
		virtual ~ImageStore() {};

		virtual bool read_at(ckcore::tuint64 offset,void *buffer,ckcore::tuint32 count) = 0;
		virtual bool write_at(ckcore::tuint64 offset,void *buffer,ckcore::tuint32 count) = 0;
		virtual ckcore::tuint64 size() = 0;
	};

	class MemoryImageStore : public ImageStore
	{
	private:
		std::vector<unsigned char> data_;

	public:
		MemoryImageStore();
		~MemoryImageStore();

		bool read_at(ckcore::tuint64 offset,void *buffer,ckcore::tuint32 count);
		bool write_at(ckcore::tuint64 offset,void *buffer,ckcore::tuint32 count);
		ckcore::tuint64 size();

		std::vector<unsigned char> &data();
	};

	class FileImageStore : public ImageStore
	{
	public:
		enum OpenMode
		{
			MODE_READ,
			MODE_WRITE
		};

	private:
		ckcore::Path file_path_;
		ckcore::File file_;
		ckcore::tuint64 size_;
		bool open_;

	public:
		FileImageStore(const ckcore::Path &file_path);
		~FileImageStore();

		bool open(OpenMode mode);
		void close();

		bool read_at(ckcore::tuint64 offset,void *buffer,ckcore::tuint32 count);
		bool write_at(ckcore::tuint64 offset,void *buffer,ckcore::tuint32 count);
		ckcore::tuint64 size();
	};
};
