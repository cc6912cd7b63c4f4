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

#include "ckiso/stringtable.hh"

namespace ckiso
{
	StringTable::StringTable()
	{
		strings_[WARNING_SKIPACCESS] = ckT("Skipping \"%s\", access denied.");
		strings_[WARNING_SKIP4GFILE] = ckT("Skipping \"%s\", the file is larger than 4 GiB.");
		strings_[WARNING_DUPLICATENAME] = ckT("Unable to find a unique ISO9660 name for \"%s\".");
		strings_[WARNING_SKIPDIRLEVEL] = ckT("Skipping \"%s\", the directory structure is deeper than %d levels.");
		strings_[WARNING_SKIPSPECIAL] = ckT("Skipping \"%s\", not a regular file or directory.");
		strings_[ERROR_OPENREAD] = ckT("Unable to open file for reading: %s.");
		strings_[ERROR_LISTDIR] = ckT("Unable to list the contents of directory: %s.");
		strings_[ERROR_IMAGESIZE] = ckT("The disc image is too large.");
		strings_[STATUS_CALCSIZE] = ckT("Calculating file system size.");
		strings_[STATUS_WRITEDATA] = ckT("Writing file data.");
	}

	StringTable::~StringTable()
	{
	}

	StringTable &StringTable::instance()
	{
		static StringTable instance;
		return instance;
	}

	const ckcore::tchar *StringTable::get_string(StringsId id)
	{
		return strings_[id];
	}

	/*
		For translation purposes.
	*/
	void StringTable::set_string(StringsId id,const ckcore::tchar *str)
	{
		strings_[id] = str;
	}
};
