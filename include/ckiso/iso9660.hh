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
#include <set>
#include <string>
#include <ckcore/types.hh>

#define ISO9660_SECTOR_SIZE						2048
#define ISO9660_VOLDESC_SEC						16			// First volume descriptor.
#define ISO9660_SETTERM_SEC						17			// Volume descriptor set terminator.
#define ISO9660_FIRST_DATA_SEC					18			// Root directory extent.
#define ISO9660_MAX_VOLDESC						99			// Descriptors scanned before giving up.
#define ISO9660_MAX_EXTENT_SIZE					0xFFFFF800
#define ISO9660_MAX_SECTORS						0xFFFFFFFF
#define ISO9660_MAX_NAMELEN_L2					31
#define ISO9660_MAX_DIRLEVEL_NORMAL				8			// Maximum is 8 for ISO9660:1988.
#define ISO9660_MAX_DIRLEVEL_1999				255			// Maximum is 255 for ISO9660:1999.

#define DIRRECORD_FILEFLAG_HIDDEN				(1 << 0)
#define DIRRECORD_FILEFLAG_DIRECTORY			(1 << 1)
#define DIRRECORD_FILEFLAG_ASSOCIATEDFILE		(1 << 2)
#define DIRRECORD_FILEFLAG_RECORD				(1 << 3)
#define DIRRECORD_FILEFLAG_PROTECTION			(1 << 4)
#define DIRRECORD_FILEFLAG_MULTIEXTENT			(1 << 7)

#define VOLDESCTYPE_BOOT_CATALOG				0
#define VOLDESCTYPE_PRIM_VOL_DESC				1
#define VOLDESCTYPE_SUPPL_VOL_DESC				2
#define VOLDESCTYPE_VOL_PARTITION_DESC			3
#define VOLDESCTYPE_VOL_DESC_SET_TERM			255

namespace ckiso
{
	/*
		Identifiers.
	*/
	extern const char *iso_ident_cd;

	/**
		Implements the naming rules of ISO9660 file systems. Converts requested
		file and directory names into identifiers valid for the selected
		interchange level and keeps the text fields of the volume descriptor.
	*/
	class Iso9660
	{
	public:
		enum InterLevel
		{
			LEVEL_1,
			LEVEL_2
		};

	private:
		bool relax_max_dir_level_;
		bool inc_file_ver_info_;
		InterLevel inter_level_;

		std::string vol_label_;
		std::string sys_ident_;
		std::string volset_ident_;
		std::string publ_ident_;
		std::string prep_ident_;

		std::string make_file_name(const std::string &file_name,size_t max_base_len,
								   size_t max_ext_len,size_t max_len) const;
		std::string make_dir_name(const std::string &dir_name,size_t max_len) const;

	public:
		Iso9660();
		~Iso9660();

		static char make_char_a(char c);
		static char make_char_d(char c);
		static std::string make_str_a(const ckcore::tstring &str,size_t max_len);
		static std::string make_str_d(const ckcore::tstring &str,size_t max_len);

		// Change of internal state functions.
		void set_volume_label(const ckcore::tchar *label);
		void set_text_fields(const ckcore::tchar *sys_ident,const ckcore::tchar *volset_ident,
							 const ckcore::tchar *publ_ident,const ckcore::tchar *prep_ident);
		void set_interchange_level(InterLevel inter_level);
		void set_include_file_ver_info(bool include);
		void set_relax_max_dir_level(bool relax);

		const std::string &get_volume_label() const;
		const std::string &get_sys_ident() const;
		const std::string &get_volset_ident() const;
		const std::string &get_publ_ident() const;
		const std::string &get_prep_ident() const;

		// Identifier functions.
		std::string make_ident(const ckcore::tstring &file_name,bool is_dir) const;
		bool make_unique(std::string &ident,const std::set<std::string> &used,
						 bool is_dir) const;

		unsigned char get_max_dir_level() const;
	};

	/*
		Helper Functions.
	*/
	void write721(unsigned char *buffer,ckcore::tuint16 val);			// Least significant byte first.
	void write722(unsigned char *buffer,ckcore::tuint16 val);			// Most significant byte first.
	void write723(unsigned char *buffer,ckcore::tuint16 val);			// Both-byte orders.
	void write731(unsigned char *buffer,ckcore::tuint32 val);			// Least significant byte first.
	void write732(unsigned char *buffer,ckcore::tuint32 val);			// Most significant byte first.
	void write733(unsigned char *buffer,ckcore::tuint32 val);			// Both-byte orders.
	ckcore::tuint16 read721(const unsigned char *buffer);
	ckcore::tuint16 read722(const unsigned char *buffer);
	ckcore::tuint16 read723(const unsigned char *buffer);
	ckcore::tuint32 read731(const unsigned char *buffer);
	ckcore::tuint32 read732(const unsigned char *buffer);
	ckcore::tuint32 read733(const unsigned char *buffer);

	ckcore::tuint64 bytes_to_sec(ckcore::tuint64 bytes);

	void iso_make_datetime(const struct tm &time,unsigned char *iso_time);		// 8.4.26.1, 17 bytes.
	void iso_make_dir_datetime(const struct tm &time,unsigned char *iso_time);	// 9.1.5, 7 bytes.
};
