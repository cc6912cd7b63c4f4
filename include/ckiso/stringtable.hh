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
#include <map>
#include <ckcore/types.hh>

namespace ckiso
{
	enum StringsId
	{
		WARNING_SKIPACCESS,
		WARNING_SKIP4GFILE,
		WARNING_DUPLICATENAME,
		WARNING_SKIPDIRLEVEL,
		WARNING_SKIPSPECIAL,
		ERROR_OPENREAD,
		ERROR_LISTDIR,
		ERROR_IMAGESIZE,
		STATUS_CALCSIZE,
		STATUS_WRITEDATA
	};

	class StringTable
	{
	private:
		std::map<StringsId,const ckcore::tchar *> strings_;

		StringTable();
		StringTable(const StringTable &obj);
		~StringTable();
		StringTable &operator=(const StringTable &obj);

	public:
		static StringTable &instance();

		const ckcore::tchar *get_string(StringsId id);
		void set_string(StringsId id,const ckcore::tchar *str);
	};
};
