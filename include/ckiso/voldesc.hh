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
#include <time.h>
#include <string>
#include <ckcore/types.hh>

// Primary volume descriptor layout (8.4).
#define VOLDESC_OFS_TYPE					0
#define VOLDESC_OFS_IDENT					1			// 5 bytes.
#define VOLDESC_OFS_VERSION					6
#define VOLDESC_OFS_SYS_IDENT				8			// 32 bytes, a-characters.
#define VOLDESC_OFS_VOL_IDENT				40			// 32 bytes, d-characters.
#define VOLDESC_OFS_VOL_SPACE_SIZE			80			// 7.3.3.
#define VOLDESC_OFS_VOLSET_SIZE				120			// 7.2.3.
#define VOLDESC_OFS_VOLSEQ_NUM				124			// 7.2.3.
#define VOLDESC_OFS_LOGICAL_BLOCK_SIZE		128			// 7.2.3.
#define VOLDESC_OFS_PATH_TABLE_SIZE			132			// 7.3.3.
#define VOLDESC_OFS_ROOT_DIR_RECORD			156			// 34 bytes.
#define VOLDESC_OFS_ROOT_EXTENT_LOC			158			// 7.3.3.
#define VOLDESC_OFS_ROOT_DATA_LEN			166			// 7.3.3.
#define VOLDESC_OFS_VOLSET_IDENT			190			// 128 bytes.
#define VOLDESC_OFS_PUBL_IDENT				318			// 128 bytes.
#define VOLDESC_OFS_PREP_IDENT				446			// 128 bytes.
#define VOLDESC_OFS_APP_IDENT				574			// 128 bytes.
#define VOLDESC_OFS_COPY_FILE_IDENT			702			// 37 bytes.
#define VOLDESC_OFS_ABST_FILE_IDENT			739			// 37 bytes.
#define VOLDESC_OFS_BIBL_FILE_IDENT			776			// 37 bytes.
#define VOLDESC_OFS_CREATE_TIME				813			// 17 bytes.
#define VOLDESC_OFS_MODIFY_TIME				830			// 17 bytes.
#define VOLDESC_OFS_EXPIRE_TIME				847			// 17 bytes.
#define VOLDESC_OFS_EFFECT_TIME				864			// 17 bytes.
#define VOLDESC_OFS_FILE_STRUCT_VER			881

#define VOLDESC_ROOT_DIR_RECORD_LEN			34

namespace ckiso
{
	/**
		In-memory representation of a primary volume descriptor. The public
		members are filled in by the caller before encode() and by decode().
	*/
	class VolumeDescriptor
	{
	public:
		unsigned char type_;
		unsigned char version_;
		ckcore::tuint32 vol_space_size_;
		ckcore::tuint16 logical_block_size_;
		ckcore::tuint32 root_extent_loc_;
		ckcore::tuint32 root_extent_len_;

		std::string sys_ident_;
		std::string vol_ident_;
		std::string volset_ident_;
		std::string publ_ident_;
		std::string prep_ident_;
		std::string app_ident_;

		struct tm create_time_;

		VolumeDescriptor();
		~VolumeDescriptor();

		void encode(unsigned char *buffer) const;
		bool decode(const unsigned char *buffer);

		static void encode_terminator(unsigned char *buffer);
		static bool has_ident(const unsigned char *buffer);
	};
};
