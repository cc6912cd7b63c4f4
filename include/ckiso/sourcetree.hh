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
#include <ckcore/path.hh>
#include <ckcore/filestream.hh>

namespace ckiso
{
	class SourceEntry
	{
	public:
		ckcore::tstring name_;
		bool is_directory_;
		bool is_special_;				// Neither a regular file nor a directory.

		SourceEntry(const ckcore::tstring &name,bool is_directory,bool is_special = false) :
			name_(name),is_directory_(is_directory),is_special_(is_special) {}
	};

	/**
		An open file in a source tree.
	*/
	class SourceFile
	{
	public:
		virtual ~SourceFile() {};

		virtual ckcore::tuint64 size() = 0;
		virtual ckcore::tint64 read(void *buffer,ckcore::tuint32 count) = 0;
	};

	/**
		The tree of files and directories that an image is built from. Paths
		are relative to the root of the tree, the root itself is the empty
		string and children are separated by '/'.
	*/
	class SourceTree
	{
	public:
		virtual ~SourceTree() {};

		/**
			Lists the entries of a directory in the order they should appear
			in the image. The "." and ".." entries are not included, entries
			that can not be included in an image are marked as special.
			@return RESULT_OK, RESULT_ACCESS_DENIED or RESULT_FAIL.
		*/
		virtual int list(const ckcore::tstring &dir_path,std::vector<SourceEntry> &entries) = 0;

		/**
			Opens a file for reading. On success the caller owns the returned
			file object and must delete it.
			@return RESULT_OK, RESULT_ACCESS_DENIED or RESULT_FAIL.
		*/
		virtual int open_file(const ckcore::tstring &file_path,SourceFile *&file) = 0;
	};

	class DiskSourceFile : public SourceFile
	{
	private:
		ckcore::FileInStream in_stream_;

	public:
		DiskSourceFile(const ckcore::Path &file_path);

		bool open();

		ckcore::tuint64 size();
		ckcore::tint64 read(void *buffer,ckcore::tuint32 count);
	};

	class DiskSourceTree : public SourceTree
	{
	private:
		ckcore::tstring base_path_;

		ckcore::tstring make_full_path(const ckcore::tstring &path) const;

	public:
		DiskSourceTree(const ckcore::tchar *base_path);
		~DiskSourceTree();

		int list(const ckcore::tstring &dir_path,std::vector<SourceEntry> &entries);
		int open_file(const ckcore::tstring &file_path,SourceFile *&file);
	};
};
