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
#include "ckiso/iso9660.hh"
#include "ckiso/voldesc.hh"

namespace ckiso
{
	/*
		Copies str into a fixed size, space padded field.
	*/
	static void write_text_field(unsigned char *buffer,const std::string &str,size_t len)
	{
		memset(buffer,' ',len);
		memcpy(buffer,str.c_str(),str.length() < len ? str.length() : len);
	}

	static std::string read_text_field(const unsigned char *buffer,size_t len)
	{
		while (len > 0 && buffer[len - 1] == ' ')
			len--;

		return std::string((const char *)buffer,len);
	}

	VolumeDescriptor::VolumeDescriptor() : type_(VOLDESCTYPE_PRIM_VOL_DESC),version_(1),
		vol_space_size_(0),logical_block_size_(ISO9660_SECTOR_SIZE),
		root_extent_loc_(0),root_extent_len_(0),app_ident_("CKISO")
	{
		memset(&create_time_,0,sizeof(create_time_));
		create_time_.tm_year = 70;
		create_time_.tm_mday = 1;
	}

	VolumeDescriptor::~VolumeDescriptor()
	{
	}

	/*
		Encodes the descriptor into a full sector, buffer must hold
		ISO9660_SECTOR_SIZE bytes.
	*/
	void VolumeDescriptor::encode(unsigned char *buffer) const
	{
		memset(buffer,0,ISO9660_SECTOR_SIZE);

		buffer[VOLDESC_OFS_TYPE] = VOLDESCTYPE_PRIM_VOL_DESC;
		memcpy(buffer + VOLDESC_OFS_IDENT,iso_ident_cd,5);
		buffer[VOLDESC_OFS_VERSION] = 1;

		write_text_field(buffer + VOLDESC_OFS_SYS_IDENT,sys_ident_,32);
		write_text_field(buffer + VOLDESC_OFS_VOL_IDENT,vol_ident_,32);

		write733(buffer + VOLDESC_OFS_VOL_SPACE_SIZE,vol_space_size_);
		write723(buffer + VOLDESC_OFS_VOLSET_SIZE,1);
		write723(buffer + VOLDESC_OFS_VOLSEQ_NUM,1);
		write723(buffer + VOLDESC_OFS_LOGICAL_BLOCK_SIZE,ISO9660_SECTOR_SIZE);

		// Root directory record.
		unsigned char *root_rec = buffer + VOLDESC_OFS_ROOT_DIR_RECORD;
		root_rec[0] = VOLDESC_ROOT_DIR_RECORD_LEN;
		write733(buffer + VOLDESC_OFS_ROOT_EXTENT_LOC,root_extent_loc_);
		write733(buffer + VOLDESC_OFS_ROOT_DATA_LEN,root_extent_len_);
		iso_make_dir_datetime(create_time_,root_rec + 18);
		root_rec[25] = DIRRECORD_FILEFLAG_DIRECTORY;
		write723(root_rec + 28,1);
		root_rec[32] = 1;
		root_rec[33] = 0;

		write_text_field(buffer + VOLDESC_OFS_VOLSET_IDENT,volset_ident_,128);
		write_text_field(buffer + VOLDESC_OFS_PUBL_IDENT,publ_ident_,128);
		write_text_field(buffer + VOLDESC_OFS_PREP_IDENT,prep_ident_,128);
		write_text_field(buffer + VOLDESC_OFS_APP_IDENT,app_ident_,128);
		write_text_field(buffer + VOLDESC_OFS_COPY_FILE_IDENT,"",37);
		write_text_field(buffer + VOLDESC_OFS_ABST_FILE_IDENT,"",37);
		write_text_field(buffer + VOLDESC_OFS_BIBL_FILE_IDENT,"",37);

		iso_make_datetime(create_time_,buffer + VOLDESC_OFS_CREATE_TIME);
		iso_make_datetime(create_time_,buffer + VOLDESC_OFS_MODIFY_TIME);

		// Not specified.
		memset(buffer + VOLDESC_OFS_EXPIRE_TIME,'0',16);
		memset(buffer + VOLDESC_OFS_EFFECT_TIME,'0',16);

		buffer[VOLDESC_OFS_FILE_STRUCT_VER] = 1;
	}

	/*
		Decodes a primary volume descriptor. Returns false if the sector holds
		any other type of descriptor, the members are left untouched then.
	*/
	bool VolumeDescriptor::decode(const unsigned char *buffer)
	{
		if (buffer[VOLDESC_OFS_TYPE] != VOLDESCTYPE_PRIM_VOL_DESC)
			return false;

		type_ = buffer[VOLDESC_OFS_TYPE];
		version_ = buffer[VOLDESC_OFS_VERSION];
		vol_space_size_ = read733(buffer + VOLDESC_OFS_VOL_SPACE_SIZE);
		logical_block_size_ = read723(buffer + VOLDESC_OFS_LOGICAL_BLOCK_SIZE);
		root_extent_loc_ = read733(buffer + VOLDESC_OFS_ROOT_EXTENT_LOC);
		root_extent_len_ = read733(buffer + VOLDESC_OFS_ROOT_DATA_LEN);

		sys_ident_ = read_text_field(buffer + VOLDESC_OFS_SYS_IDENT,32);
		vol_ident_ = read_text_field(buffer + VOLDESC_OFS_VOL_IDENT,32);
		volset_ident_ = read_text_field(buffer + VOLDESC_OFS_VOLSET_IDENT,128);
		publ_ident_ = read_text_field(buffer + VOLDESC_OFS_PUBL_IDENT,128);
		prep_ident_ = read_text_field(buffer + VOLDESC_OFS_PREP_IDENT,128);
		app_ident_ = read_text_field(buffer + VOLDESC_OFS_APP_IDENT,128);
		return true;
	}

	void VolumeDescriptor::encode_terminator(unsigned char *buffer)
	{
		memset(buffer,0,ISO9660_SECTOR_SIZE);

		buffer[VOLDESC_OFS_TYPE] = VOLDESCTYPE_VOL_DESC_SET_TERM;
		memcpy(buffer + VOLDESC_OFS_IDENT,iso_ident_cd,5);
		buffer[VOLDESC_OFS_VERSION] = 1;
	}

	bool VolumeDescriptor::has_ident(const unsigned char *buffer)
	{
		return memcmp(buffer + VOLDESC_OFS_IDENT,iso_ident_cd,5) == 0;
	}
};
