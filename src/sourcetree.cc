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

#include <errno.h>
#include <string.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <ckcore/directory.hh>
#include <ckcore/path.hh>
#include "ckiso/const.hh"
#include "ckiso/sourcetree.hh"

namespace ckiso
{
	static bool is_access_error(int err)
	{
		return err == EACCES || err == EPERM;
	}

	DiskSourceFile::DiskSourceFile(const ckcore::Path &file_path) :
		in_stream_(file_path)
	{
	}

	bool DiskSourceFile::open()
	{
		return in_stream_.open();
	}

	ckcore::tuint64 DiskSourceFile::size()
	{
		return in_stream_.size();
	}

	ckcore::tint64 DiskSourceFile::read(void *buffer,ckcore::tuint32 count)
	{
		return in_stream_.read(buffer,count);
	}

	DiskSourceTree::DiskSourceTree(const ckcore::tchar *base_path) :
		base_path_(base_path)
	{
		// Strip any trailing delimiter, internal paths begin with one.
		while (base_path_.length() > 1 &&
			   (base_path_[base_path_.length() - 1] == '/' ||
				base_path_[base_path_.length() - 1] == '\\'))
		{
			base_path_.resize(base_path_.length() - 1);
		}
	}

	DiskSourceTree::~DiskSourceTree()
	{
	}

	ckcore::tstring DiskSourceTree::make_full_path(const ckcore::tstring &path) const
	{
		return base_path_ + path;
	}

	int DiskSourceTree::list(const ckcore::tstring &dir_path,std::vector<SourceEntry> &entries)
	{
		ckcore::Path full_path(make_full_path(dir_path).c_str());
		if (!ckcore::Directory::exist(full_path))
			return RESULT_FAIL;

		ckcore::Directory dir(full_path);

		// The directory iterator does not report failures, an unreadable
		// directory simply ends early and leaves errno set.
		errno = 0;

		std::vector<ckcore::tstring> names;

		ckcore::Directory::Iterator it;
		for (it = dir.begin(); it != dir.end(); it++)
		{
			const ckcore::tstring &name = *it;
			if (name == ckT(".") || name == ckT(".."))
				continue;

			names.push_back(name);
		}

		int err = errno;
		if (err != 0)
			return names.empty() && is_access_error(err) ? RESULT_ACCESS_DENIED : RESULT_FAIL;

		std::vector<ckcore::tstring>::const_iterator it_name;
		for (it_name = names.begin(); it_name != names.end(); it_name++)
		{
			ckcore::tstring entry_path = make_full_path(dir_path) + ckT("/") + *it_name;

			struct stat fst;
			memset(&fst,0,sizeof(struct stat));
			if (stat(entry_path.c_str(),&fst) != 0)
			{
				// Dangling links and entries removed since the listing can not
				// be included but do not make the directory unreadable.
				if (errno == ENOENT || errno == ELOOP || is_access_error(errno))
				{
					entries.push_back(SourceEntry(*it_name,false,true));
					continue;
				}

				return RESULT_FAIL;
			}

			if (S_ISDIR(fst.st_mode))
				entries.push_back(SourceEntry(*it_name,true));
			else if (S_ISREG(fst.st_mode))
				entries.push_back(SourceEntry(*it_name,false));
			else
				entries.push_back(SourceEntry(*it_name,false,true));
		}

		return RESULT_OK;
	}

	int DiskSourceTree::open_file(const ckcore::tstring &file_path,SourceFile *&file)
	{
		ckcore::Path full_path(make_full_path(file_path).c_str());

		DiskSourceFile *disk_file = new DiskSourceFile(full_path);

		errno = 0;
		if (!disk_file->open())
		{
			int err = errno;
			delete disk_file;

			return is_access_error(err) ? RESULT_ACCESS_DENIED : RESULT_FAIL;
		}

		file = disk_file;
		return RESULT_OK;
	}
};
