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
#include <ckcore/types.hh>

namespace ckiso
{
	/**
		Hands out non-overlapping sector ranges in increasing order. Sectors
		are never reused.
	*/
	class BlockAllocator
	{
	private:
		ckcore::tuint64 next_free_sec_;

	public:
		BlockAllocator(ckcore::tuint64 start_sec);
		~BlockAllocator();

		ckcore::tuint64 allocate_sectors(ckcore::tuint64 num_secs);
		ckcore::tuint64 allocate_bytes(ckcore::tuint64 num_bytes);

		ckcore::tuint64 get_next_free() const;

		static ckcore::tuint64 blocks_needed(ckcore::tuint64 num_bytes);
	};
};
