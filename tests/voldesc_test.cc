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
#include <gtest/gtest.h>
#include <ckiso/iso9660.hh>
#include <ckiso/voldesc.hh>

namespace ckiso
{
	TEST(VolumeDescriptorTest,EncodeDecodeRoundTrip)
	{
		VolumeDescriptor voldesc;
		voldesc.vol_space_size_ = 24;
		voldesc.root_extent_loc_ = 18;
		voldesc.root_extent_len_ = 2048;
		voldesc.sys_ident_ = "LINUX";
		voldesc.vol_ident_ = "MY_VOLUME";

		unsigned char buffer[ISO9660_SECTOR_SIZE];
		voldesc.encode(buffer);

		EXPECT_EQ(VOLDESCTYPE_PRIM_VOL_DESC,buffer[VOLDESC_OFS_TYPE]);
		EXPECT_EQ(0,memcmp(buffer + VOLDESC_OFS_IDENT,"CD001",5));
		EXPECT_EQ(1,buffer[VOLDESC_OFS_VERSION]);
		EXPECT_EQ(1,buffer[VOLDESC_OFS_FILE_STRUCT_VER]);

		VolumeDescriptor decoded;
		ASSERT_TRUE(decoded.decode(buffer));
		EXPECT_EQ(VOLDESCTYPE_PRIM_VOL_DESC,decoded.type_);
		EXPECT_EQ(24u,decoded.vol_space_size_);
		EXPECT_EQ(18u,decoded.root_extent_loc_);
		EXPECT_EQ(2048u,decoded.root_extent_len_);
		EXPECT_EQ(ISO9660_SECTOR_SIZE,decoded.logical_block_size_);
		EXPECT_EQ("LINUX",decoded.sys_ident_);
		EXPECT_EQ("MY_VOLUME",decoded.vol_ident_);
	}

	TEST(VolumeDescriptorTest,WritesBothByteOrders)
	{
		VolumeDescriptor voldesc;
		voldesc.vol_space_size_ = 0x01020304;
		voldesc.root_extent_loc_ = 18;
		voldesc.root_extent_len_ = 4096;

		unsigned char buffer[ISO9660_SECTOR_SIZE];
		voldesc.encode(buffer);

		EXPECT_EQ(0x01020304u,read731(buffer + VOLDESC_OFS_VOL_SPACE_SIZE));
		EXPECT_EQ(0x01020304u,read732(buffer + VOLDESC_OFS_VOL_SPACE_SIZE + 4));
		EXPECT_EQ(ISO9660_SECTOR_SIZE,read721(buffer + VOLDESC_OFS_LOGICAL_BLOCK_SIZE));
		EXPECT_EQ(ISO9660_SECTOR_SIZE,read722(buffer + VOLDESC_OFS_LOGICAL_BLOCK_SIZE + 2));
		EXPECT_EQ(4096u,read732(buffer + VOLDESC_OFS_ROOT_DATA_LEN + 4));
	}

	TEST(VolumeDescriptorTest,RootRecordIsSelfReference)
	{
		VolumeDescriptor voldesc;
		voldesc.root_extent_loc_ = 18;
		voldesc.root_extent_len_ = 2048;

		unsigned char buffer[ISO9660_SECTOR_SIZE];
		voldesc.encode(buffer);

		const unsigned char *root_rec = buffer + VOLDESC_OFS_ROOT_DIR_RECORD;
		EXPECT_EQ(VOLDESC_ROOT_DIR_RECORD_LEN,root_rec[0]);
		EXPECT_NE(0,root_rec[25] & DIRRECORD_FILEFLAG_DIRECTORY);
		EXPECT_EQ(1,root_rec[32]);
		EXPECT_EQ(0,root_rec[33]);
	}

	TEST(VolumeDescriptorTest,TextFieldsArePadded)
	{
		VolumeDescriptor voldesc;
		voldesc.vol_ident_ = "CDROM";

		unsigned char buffer[ISO9660_SECTOR_SIZE];
		voldesc.encode(buffer);

		EXPECT_EQ(0,memcmp(buffer + VOLDESC_OFS_VOL_IDENT,"CDROM",5));
		for (int i = 5; i < 32; i++)
			EXPECT_EQ(' ',buffer[VOLDESC_OFS_VOL_IDENT + i]);
	}

	TEST(VolumeDescriptorTest,DecodeRejectsOtherTypes)
	{
		VolumeDescriptor voldesc;
		voldesc.vol_space_size_ = 100;

		unsigned char buffer[ISO9660_SECTOR_SIZE];
		voldesc.encode(buffer);
		buffer[VOLDESC_OFS_TYPE] = VOLDESCTYPE_SUPPL_VOL_DESC;

		VolumeDescriptor decoded;
		EXPECT_FALSE(decoded.decode(buffer));
		EXPECT_EQ(0u,decoded.vol_space_size_);
	}

	TEST(VolumeDescriptorTest,Terminator)
	{
		unsigned char buffer[ISO9660_SECTOR_SIZE];
		memset(buffer,0xFF,sizeof(buffer));
		VolumeDescriptor::encode_terminator(buffer);

		EXPECT_EQ(VOLDESCTYPE_VOL_DESC_SET_TERM,buffer[VOLDESC_OFS_TYPE]);
		EXPECT_TRUE(VolumeDescriptor::has_ident(buffer));
		EXPECT_EQ(1,buffer[VOLDESC_OFS_VERSION]);
		EXPECT_EQ(0,buffer[ISO9660_SECTOR_SIZE - 1]);

		VolumeDescriptor decoded;
		EXPECT_FALSE(decoded.decode(buffer));
	}
};
