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

#include <ctype.h>
#include <stdio.h>
#include <string.h>
#include <ckcore/string.hh>
#include "ckiso/iso9660.hh"

namespace ckiso
{
	/*
		Global Identifiers.
	*/
	const char *iso_ident_cd = "CD001";

	/*
		Helper Functions.
	*/
	void write721(unsigned char *buffer,ckcore::tuint16 val)
	{
		buffer[0] = val & 0xFF;
		buffer[1] = (val >> 8) & 0xFF;
	}

	void write722(unsigned char *buffer,ckcore::tuint16 val)
	{
		buffer[0] = (val >> 8) & 0xFF;
		buffer[1] = val & 0xFF;
	}

	void write723(unsigned char *buffer,ckcore::tuint16 val)
	{
		write721(buffer,val);
		write722(buffer + 2,val);
	}

	void write731(unsigned char *buffer,ckcore::tuint32 val)
	{
		buffer[0] = (unsigned char)(val & 0xFF);
		buffer[1] = (unsigned char)((val >> 8) & 0xFF);
		buffer[2] = (unsigned char)((val >> 16) & 0xFF);
		buffer[3] = (unsigned char)((val >> 24) & 0xFF);
	}

	void write732(unsigned char *buffer,ckcore::tuint32 val)
	{
		buffer[0] = (unsigned char)((val >> 24) & 0xFF);
		buffer[1] = (unsigned char)((val >> 16) & 0xFF);
		buffer[2] = (unsigned char)((val >> 8) & 0xFF);
		buffer[3] = (unsigned char)(val & 0xFF);
	}

	void write733(unsigned char *buffer,ckcore::tuint32 val)
	{
		write731(buffer,val);
		write732(buffer + 4,val);
	}

	ckcore::tuint16 read721(const unsigned char *buffer)
	{
		return (ckcore::tuint16)(((ckcore::tuint16)buffer[1] << 8) | buffer[0]);
	}

	ckcore::tuint16 read722(const unsigned char *buffer)
	{
		return (ckcore::tuint16)(((ckcore::tuint16)buffer[0] << 8) | buffer[1]);
	}

	/*
		Only the little endian half is trusted, some writers leave the
		big endian half empty.
	*/
	ckcore::tuint16 read723(const unsigned char *buffer)
	{
		return read721(buffer);
	}

	ckcore::tuint32 read731(const unsigned char *buffer)
	{
		return ((ckcore::tuint32)buffer[3] << 24) | ((ckcore::tuint32)buffer[2] << 16) |
			((ckcore::tuint32)buffer[1] << 8) | buffer[0];
	}

	ckcore::tuint32 read732(const unsigned char *buffer)
	{
		return ((ckcore::tuint32)buffer[0] << 24) | ((ckcore::tuint32)buffer[1] << 16) |
			((ckcore::tuint32)buffer[2] << 8) | buffer[3];
	}

	ckcore::tuint32 read733(const unsigned char *buffer)
	{
		return read731(buffer);
	}

	ckcore::tuint64 bytes_to_sec(ckcore::tuint64 bytes)
	{
		return (bytes + ISO9660_SECTOR_SIZE - 1) / ISO9660_SECTOR_SIZE;
	}

	static int clamp_field(int val,int min,int max)
	{
		if (val < min)
			return min;
		if (val > max)
			return max;

		return val;
	}

	void iso_make_datetime(const struct tm &time,unsigned char *iso_time)
	{
		char buffer[17];
		sprintf(buffer,"%.4u%.2u%.2u%.2u%.2u%.2u00",
				(unsigned int)clamp_field(time.tm_year + 1900,1,9999),
				(unsigned int)clamp_field(time.tm_mon + 1,1,12),
				(unsigned int)clamp_field(time.tm_mday,1,31),
				(unsigned int)clamp_field(time.tm_hour,0,23),
				(unsigned int)clamp_field(time.tm_min,0,59),
				(unsigned int)clamp_field(time.tm_sec,0,59));
		memcpy(iso_time,buffer,16);

		// FIXME: Add support for UNIX time zone information.
		iso_time[16] = 0;
	}

	void iso_make_dir_datetime(const struct tm &time,unsigned char *iso_time)
	{
		iso_time[0] = (unsigned char)clamp_field(time.tm_year,0,255);
		iso_time[1] = (unsigned char)clamp_field(time.tm_mon + 1,1,12);
		iso_time[2] = (unsigned char)clamp_field(time.tm_mday,1,31);
		iso_time[3] = (unsigned char)clamp_field(time.tm_hour,0,23);
		iso_time[4] = (unsigned char)clamp_field(time.tm_min,0,59);
		iso_time[5] = (unsigned char)clamp_field(time.tm_sec,0,59);
		iso_time[6] = 0;
	}

	static std::string to_ansi(const ckcore::tstring &str)
	{
#ifdef _UNICODE
		char *ansi_str = new char [str.length() + 1];
		ckcore::string::utf16_to_ansi(str.c_str(),ansi_str,(int)str.length() + 1);

		std::string res = ansi_str;
		delete [] ansi_str;
		return res;
#else
		return str;
#endif
	}

	Iso9660::Iso9660() : relax_max_dir_level_(false),inc_file_ver_info_(true),
		inter_level_(LEVEL_1)
	{
	}

	Iso9660::~Iso9660()
	{
	}

	/*
		Convert the specified character to an a-character (appendix A).
	*/
	char Iso9660::make_char_a(char c)
	{
		char res = toupper(c);

		// Make sure that it's a valid character, otherwise return '_'.
		if ((res >= 0x20 && res <= 0x22) ||
			(res >= 0x25 && res <= 0x39) ||
			(res >= 0x41 && res <= 0x5A) || res == 0x5F)
			return res;

		return '_';
	}

	/*
		Convert the specified character to a d-character (appendix A).
	*/
	char Iso9660::make_char_d(char c)
	{
		char res = toupper(c);

		if ((res >= 0x30 && res <= 0x39) ||
			(res >= 0x41 && res <= 0x5A) || res == 0x5F)
			return res;

		return '_';
	}

	std::string Iso9660::make_str_a(const ckcore::tstring &str,size_t max_len)
	{
		std::string res = to_ansi(str);
		if (res.length() > max_len)
			res.resize(max_len);

		for (size_t i = 0; i < res.length(); i++)
			res[i] = make_char_a(res[i]);

		return res;
	}

	std::string Iso9660::make_str_d(const ckcore::tstring &str,size_t max_len)
	{
		std::string res = to_ansi(str);
		if (res.length() > max_len)
			res.resize(max_len);

		for (size_t i = 0; i < res.length(); i++)
			res[i] = make_char_d(res[i]);

		return res;
	}

	/*
		Converts the file name into a base name of at most max_base_len
		d-characters and an extension of at most max_ext_len d-characters.
		The complete name, including the separator, never exceeds max_len.
	*/
	std::string Iso9660::make_file_name(const std::string &file_name,size_t max_base_len,
										size_t max_ext_len,size_t max_len) const
	{
		std::string res;

		size_t ext_delim = file_name.rfind('.');
		if (ext_delim == std::string::npos)
		{
			size_t max = file_name.length() < max_base_len ? file_name.length() : max_base_len;
			for (size_t i = 0; i < max; i++)
				res += make_char_d(file_name[i]);
		}
		else
		{
			size_t ext_len = file_name.length() - ext_delim - 1;
			if (ext_len > max_ext_len)
				ext_len = max_ext_len;

			size_t max = ext_delim < max_base_len ? ext_delim : max_base_len;
			if (max > max_len - 1 - ext_len)
				max = max_len - 1 - ext_len;

			for (size_t i = 0; i < max; i++)
				res += make_char_d(file_name[i]);

			res += '.';

			// Copy the extension.
			for (size_t i = 0; i < ext_len; i++)
				res += make_char_d(file_name[ext_delim + 1 + i]);
		}

		return res;
	}

	std::string Iso9660::make_dir_name(const std::string &dir_name,size_t max_len) const
	{
		size_t max = dir_name.length() < max_len ? dir_name.length() : max_len;

		std::string res;
		for (size_t i = 0; i < max; i++)
			res += make_char_d(dir_name[i]);

		return res;
	}

	void Iso9660::set_volume_label(const ckcore::tchar *label)
	{
		vol_label_ = make_str_d(label,32);
	}

	void Iso9660::set_text_fields(const ckcore::tchar *sys_ident,const ckcore::tchar *volset_ident,
								  const ckcore::tchar *publ_ident,const ckcore::tchar *prep_ident)
	{
		sys_ident_ = make_str_a(sys_ident,32);
		volset_ident_ = make_str_d(volset_ident,128);
		publ_ident_ = make_str_a(publ_ident,128);
		prep_ident_ = make_str_a(prep_ident,128);
	}

	void Iso9660::set_interchange_level(InterLevel inter_level)
	{
		inter_level_ = inter_level;
	}

	void Iso9660::set_include_file_ver_info(bool include)
	{
		inc_file_ver_info_ = include;
	}

	void Iso9660::set_relax_max_dir_level(bool relax)
	{
		relax_max_dir_level_ = relax;
	}

	const std::string &Iso9660::get_volume_label() const
	{
		return vol_label_;
	}

	const std::string &Iso9660::get_sys_ident() const
	{
		return sys_ident_;
	}

	const std::string &Iso9660::get_volset_ident() const
	{
		return volset_ident_;
	}

	const std::string &Iso9660::get_publ_ident() const
	{
		return publ_ident_;
	}

	const std::string &Iso9660::get_prep_ident() const
	{
		return prep_ident_;
	}

	/*
		Returns the identifier to use for the given source name. Level 1 allows
		8.3 file names and 8 character directory names, level 2 allows 31
		characters. File identifiers receive the ";1" version suffix when
		version information is enabled.
	*/
	std::string Iso9660::make_ident(const ckcore::tstring &file_name,bool is_dir) const
	{
		std::string ansi_file_name = to_ansi(file_name);

		std::string ident;
		if (is_dir)
		{
			ident = make_dir_name(ansi_file_name,inter_level_ == LEVEL_1 ?
								  8 : ISO9660_MAX_NAMELEN_L2);
		}
		else
		{
			if (inter_level_ == LEVEL_1)
				ident = make_file_name(ansi_file_name,8,3,12);
			else
				ident = make_file_name(ansi_file_name,ISO9660_MAX_NAMELEN_L2,
									   ISO9660_MAX_NAMELEN_L2 - 1,ISO9660_MAX_NAMELEN_L2);

			if (inc_file_ver_info_)
				ident += ";1";
		}

		return ident;
	}

	/*
		Makes ident unique among the identifiers in used by replacing the end
		of its base name with an increasing number. Returns false if no unique
		identifier could be found, ident is left untouched in that case.
	*/
	bool Iso9660::make_unique(std::string &ident,const std::set<std::string> &used,
							  bool is_dir) const
	{
		if (used.find(ident) == used.end())
			return true;

		size_t ident_end = ident.length();
		if (!is_dir && ident_end > 2 && ident.compare(ident_end - 2,2,";1") == 0)
			ident_end -= 2;

		size_t base_end = ident_end;
		if (!is_dir)
		{
			size_t ext_delim = ident.rfind('.',ident_end - 1);
			if (ext_delim != std::string::npos)
				base_end = ext_delim;
		}

		char number[8];
		for (unsigned int i = 1; i < 1000; i++)
		{
			sprintf(number,"%u",i);
			size_t number_len = strlen(number);
			if (number_len > base_end)
				break;

			std::string candidate = ident;
			candidate.replace(base_end - number_len,number_len,number);

			if (used.find(candidate) == used.end())
			{
				ident = candidate;
				return true;
			}
		}

		return false;
	}

	/*
		Returns the deepest directory level allowed in the file system, the
		root directory is on level 1.
	*/
	unsigned char Iso9660::get_max_dir_level() const
	{
		if (relax_max_dir_level_)
			return ISO9660_MAX_DIRLEVEL_1999;

		return ISO9660_MAX_DIRLEVEL_NORMAL;
	}
};
