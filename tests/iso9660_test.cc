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

namespace ckiso
{
	TEST(Iso9660Test,BothByteOrderHelpers)
	{
		unsigned char buffer[8];
		write733(buffer,0x12345678);

		const unsigned char expected[8] = { 0x78,0x56,0x34,0x12,0x12,0x34,0x56,0x78 };
		for (int i = 0; i < 8; i++)
			EXPECT_EQ(expected[i],buffer[i]);

		EXPECT_EQ(0x12345678u,read733(buffer));

		write723(buffer,0x0800);
		EXPECT_EQ(0x00,buffer[0]);
		EXPECT_EQ(0x08,buffer[1]);
		EXPECT_EQ(0x08,buffer[2]);
		EXPECT_EQ(0x00,buffer[3]);
		EXPECT_EQ(0x0800,read723(buffer));
	}

	TEST(Iso9660Test,BytesToSectors)
	{
		EXPECT_EQ(0u,bytes_to_sec(0));
		EXPECT_EQ(1u,bytes_to_sec(1));
		EXPECT_EQ(1u,bytes_to_sec(ISO9660_SECTOR_SIZE));
		EXPECT_EQ(2u,bytes_to_sec(ISO9660_SECTOR_SIZE + 1));
	}

	TEST(Iso9660Test,Level1Names)
	{
		Iso9660 iso9660;
		EXPECT_EQ("README.TXT;1",iso9660.make_ident("readme.txt",false));
		EXPECT_EQ("LONGFILE.TEX;1",iso9660.make_ident("longfilename.text",false));
		EXPECT_EQ("A_B.C;1",iso9660.make_ident("a b.c",false));
		EXPECT_EQ("ARCHIVE_.GZ;1",iso9660.make_ident("archive.tar.gz",false));
		EXPECT_EQ("MAKEFILE;1",iso9660.make_ident("Makefile",false));
		EXPECT_EQ("MY_DIR",iso9660.make_ident("my.dir",true));
		EXPECT_EQ("VERYLONG",iso9660.make_ident("verylongdirectory",true));
	}

	TEST(Iso9660Test,Level2Names)
	{
		Iso9660 iso9660;
		iso9660.set_interchange_level(Iso9660::LEVEL_2);

		EXPECT_EQ("LONGFILENAME.TEXT;1",iso9660.make_ident("longfilename.text",false));
		EXPECT_EQ("VERYLONGDIRECTORY",iso9660.make_ident("verylongdirectory",true));

		std::string ident = iso9660.make_ident(std::string(40,'x') + ".txt",false);
		EXPECT_EQ(ISO9660_MAX_NAMELEN_L2 + 2u,ident.length());
		EXPECT_EQ(".TXT;1",ident.substr(ident.length() - 6));
	}

	TEST(Iso9660Test,WithoutVersionInfo)
	{
		Iso9660 iso9660;
		iso9660.set_include_file_ver_info(false);

		EXPECT_EQ("README.TXT",iso9660.make_ident("readme.txt",false));
	}

	TEST(Iso9660Test,UniqueNames)
	{
		Iso9660 iso9660;

		std::set<std::string> used;
		std::string ident = "README.TXT;1";
		EXPECT_TRUE(iso9660.make_unique(ident,used,false));
		EXPECT_EQ("README.TXT;1",ident);

		used.insert("LONGFILE.TEX;1");
		ident = "LONGFILE.TEX;1";
		EXPECT_TRUE(iso9660.make_unique(ident,used,false));
		EXPECT_EQ("LONGFIL1.TEX;1",ident);

		used.insert(ident);
		ident = "LONGFILE.TEX;1";
		EXPECT_TRUE(iso9660.make_unique(ident,used,false));
		EXPECT_EQ("LONGFIL2.TEX;1",ident);

		used.insert("VERYLONG");
		ident = "VERYLONG";
		EXPECT_TRUE(iso9660.make_unique(ident,used,true));
		EXPECT_EQ("VERYLON1",ident);

		used.insert("AB.TXT;1");
		ident = "AB.TXT;1";
		EXPECT_TRUE(iso9660.make_unique(ident,used,false));
		EXPECT_EQ("A1.TXT;1",ident);
	}

	TEST(Iso9660Test,TextFields)
	{
		Iso9660 iso9660;
		iso9660.set_volume_label("my volume");
		iso9660.set_text_fields("linux","set","publisher","preparer");

		EXPECT_EQ("MY_VOLUME",iso9660.get_volume_label());
		EXPECT_EQ("LINUX",iso9660.get_sys_ident());
		EXPECT_EQ("SET",iso9660.get_volset_ident());
		EXPECT_EQ("PUBLISHER",iso9660.get_publ_ident());
		EXPECT_EQ("PREPARER",iso9660.get_prep_ident());

		iso9660.set_volume_label("a very long volume label that does not fit");
		EXPECT_EQ(32u,iso9660.get_volume_label().length());
	}

	TEST(Iso9660Test,DateTime)
	{
		struct tm time;
		memset(&time,0,sizeof(time));
		time.tm_year = 2009 - 1900;
		time.tm_mon = 4;
		time.tm_mday = 17;
		time.tm_hour = 13;
		time.tm_min = 5;
		time.tm_sec = 60;

		unsigned char iso_time[17];
		iso_make_datetime(time,iso_time);
		EXPECT_EQ(std::string("2009051713055900"),std::string((const char *)iso_time,16));
		EXPECT_EQ(0,iso_time[16]);

		unsigned char dir_time[7];
		iso_make_dir_datetime(time,dir_time);
		EXPECT_EQ(109,dir_time[0]);
		EXPECT_EQ(5,dir_time[1]);
		EXPECT_EQ(59,dir_time[5]);
	}

	TEST(Iso9660Test,DateTimeOutOfRange)
	{
		struct tm time;
		memset(&time,0,sizeof(time));
		time.tm_year = 10000 - 1900;
		time.tm_mon = 13;
		time.tm_mday = 0;
		time.tm_hour = -1;
		time.tm_min = 75;
		time.tm_sec = -3;

		// The field following the date must survive.
		unsigned char iso_time[18];
		iso_time[17] = 0xAA;
		iso_make_datetime(time,iso_time);
		EXPECT_EQ(std::string("9999120100590000"),std::string((const char *)iso_time,16));
		EXPECT_EQ(0,iso_time[16]);
		EXPECT_EQ(0xAA,iso_time[17]);

		unsigned char dir_time[7];
		iso_make_dir_datetime(time,dir_time);
		EXPECT_EQ(255,dir_time[0]);
		EXPECT_EQ(12,dir_time[1]);
		EXPECT_EQ(1,dir_time[2]);
		EXPECT_EQ(0,dir_time[3]);
		EXPECT_EQ(59,dir_time[4]);
		EXPECT_EQ(0,dir_time[5]);

		time.tm_year = -2000;
		iso_make_datetime(time,iso_time);
		EXPECT_EQ(std::string("0001"),std::string((const char *)iso_time,4));
	}

	TEST(Iso9660Test,MaxDirLevel)
	{
		Iso9660 iso9660;
		EXPECT_EQ(ISO9660_MAX_DIRLEVEL_NORMAL,iso9660.get_max_dir_level());

		iso9660.set_relax_max_dir_level(true);
		EXPECT_EQ(ISO9660_MAX_DIRLEVEL_1999,iso9660.get_max_dir_level());
	}
};
