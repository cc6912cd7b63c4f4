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

#include <gtest/gtest.h>
#include <ckiso/blockallocator.hh>

namespace ckiso
{
	TEST(BlockAllocatorTest,BlocksNeeded)
	{
		EXPECT_EQ(0u,BlockAllocator::blocks_needed(0));
		EXPECT_EQ(1u,BlockAllocator::blocks_needed(1));
		EXPECT_EQ(1u,BlockAllocator::blocks_needed(2047));
		EXPECT_EQ(1u,BlockAllocator::blocks_needed(2048));
		EXPECT_EQ(2u,BlockAllocator::blocks_needed(2049));
		EXPECT_EQ(3u,BlockAllocator::blocks_needed(5000));
		EXPECT_EQ(0x200000u,BlockAllocator::blocks_needed(0x100000000ULL));
	}

	TEST(BlockAllocatorTest,AllocatesSequentially)
	{
		BlockAllocator allocator(18);
		EXPECT_EQ(18u,allocator.get_next_free());

		EXPECT_EQ(18u,allocator.allocate_bytes(5000));
		EXPECT_EQ(21u,allocator.get_next_free());

		EXPECT_EQ(21u,allocator.allocate_bytes(2048));
		EXPECT_EQ(22u,allocator.allocate_sectors(4));
		EXPECT_EQ(26u,allocator.get_next_free());
	}

	TEST(BlockAllocatorTest,ZeroLengthAllocationKeepsCursor)
	{
		BlockAllocator allocator(30);
		EXPECT_EQ(30u,allocator.allocate_bytes(0));
		EXPECT_EQ(30u,allocator.allocate_bytes(0));
		EXPECT_EQ(30u,allocator.get_next_free());

		EXPECT_EQ(30u,allocator.allocate_bytes(1));
		EXPECT_EQ(31u,allocator.get_next_free());
	}
};
