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

#include "ckiso/iso9660.hh"
#include "ckiso/blockallocator.hh"

namespace ckiso
{
	BlockAllocator::BlockAllocator(ckcore::tuint64 start_sec) :
		next_free_sec_(start_sec)
	{
	}

	BlockAllocator::~BlockAllocator()
	{
	}

	/**
		Allocates a number of sectors.
		@param num_secs the number of sectors to allocate.
		@return the first sector of the allocated range.
	*/
	ckcore::tuint64 BlockAllocator::allocate_sectors(ckcore::tuint64 num_secs)
	{
		ckcore::tuint64 start_sec = next_free_sec_;
		next_free_sec_ += num_secs;

		return start_sec;
	}

	/**
		Allocates enough sectors to hold the specified number of bytes. A zero
		byte allocation returns the next free sector without allocating
		anything.
		@param num_bytes the number of bytes to allocate room for.
		@return the first sector of the allocated range.
	*/
	ckcore::tuint64 BlockAllocator::allocate_bytes(ckcore::tuint64 num_bytes)
	{
		return allocate_sectors(blocks_needed(num_bytes));
	}

	/**
		Returns the next free unallocated sector.
	*/
	ckcore::tuint64 BlockAllocator::get_next_free() const
	{
		return next_free_sec_;
	}

	ckcore::tuint64 BlockAllocator::blocks_needed(ckcore::tuint64 num_bytes)
	{
		return bytes_to_sec(num_bytes);
	}
};
