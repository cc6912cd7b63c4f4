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

#include "ckiso/const.hh"
#include "ckiso/iso9660.hh"
#include "ckiso/iso9660reader.hh"

namespace ckiso
{
	LogListing::LogListing(ckcore::Log &log) : log_(log)
	{
	}

	void LogListing::on_entry(const DirRecord &rec,int depth)
	{
		if (rec.is_self_or_parent())
			return;

		for (int i = 0; i < depth; i++)
			log_.print(ckT("    "));

		// Identifiers are plain ASCII.
		ckcore::tstring name(rec.ident_.begin(),rec.ident_.end());
		if (rec.is_directory_)
			log_.print_line(ckT("[DIR] %s"),name.c_str());
		else
			log_.print_line(ckT("%s (%u bytes)"),name.c_str(),rec.data_len_);
	}

	Iso9660Reader::Iso9660Reader(ckcore::Log &log) : log_(log)
	{
	}

	Iso9660Reader::~Iso9660Reader()
	{
	}

	/*
		Scans the volume descriptor set for the primary volume descriptor.
	*/
	int Iso9660Reader::read_voldesc(ImageStore &store)
	{
		unsigned char buffer[ISO9660_SECTOR_SIZE];

		for (unsigned int i = 0; i < ISO9660_MAX_VOLDESC; i++)
		{
			ckcore::tuint64 sec = ISO9660_VOLDESC_SEC + i;
			if ((sec + 1) * ISO9660_SECTOR_SIZE > store.size())
			{
				log_.print_line(ckT("  Error: The image ends before a primary volume descriptor was found."));
				return RESULT_NO_PVD;
			}

			if (!store.read_at(sec * ISO9660_SECTOR_SIZE,buffer,ISO9660_SECTOR_SIZE))
			{
				log_.print_line(ckT("  Error: Unable to read volume descriptor at sector %u."),
					(unsigned int)sec);
				return RESULT_FAIL;
			}

			if (!VolumeDescriptor::has_ident(buffer))
			{
				log_.print_line(ckT("  Error: Sector %u does not contain a volume descriptor."),
					(unsigned int)sec);
				return RESULT_NO_PVD;
			}

			if (buffer[0] == VOLDESCTYPE_VOL_DESC_SET_TERM)
			{
				log_.print_line(ckT("  Error: No primary volume descriptor before the set terminator at sector %u."),
					(unsigned int)sec);
				return RESULT_NO_PVD;
			}

			if (voldesc_.decode(buffer))
			{
				if (voldesc_.logical_block_size_ != ISO9660_SECTOR_SIZE)
				{
					log_.print_line(ckT("  Error: Unsupported logical block size %u."),
						(unsigned int)voldesc_.logical_block_size_);
					return RESULT_MALFORMED;
				}

				log_.print_line(ckT("  Primary volume descriptor at sector %u, %u sectors."),
					(unsigned int)sec,voldesc_.vol_space_size_);
				return RESULT_OK;
			}

			log_.print_line(ckT("  Skipping volume descriptor of type %u at sector %u."),
				(unsigned int)buffer[0],(unsigned int)sec);
		}

		log_.print_line(ckT("  Error: No primary volume descriptor in the first %u descriptors."),
			ISO9660_MAX_VOLDESC);
		return RESULT_NO_PVD;
	}

	bool Iso9660Reader::check_extent(ckcore::tuint32 extent_loc,ckcore::tuint32 extent_len) const
	{
		return (ckcore::tuint64)extent_loc + bytes_to_sec(extent_len) <= voldesc_.vol_space_size_;
	}

	int Iso9660Reader::read_dir(ImageStore &store,DirectoryListener &listener,
								ckcore::tuint32 extent_loc,ckcore::tuint32 extent_len,int depth)
	{
		if (!check_extent(extent_loc,extent_len))
		{
			log_.print_line(ckT("  Error: Directory extent (%u,%u) is outside the volume."),
				extent_loc,extent_len);
			return RESULT_MALFORMED;
		}

		unsigned char buffer[ISO9660_SECTOR_SIZE];

		ckcore::tuint64 num_secs = bytes_to_sec(extent_len);
		for (ckcore::tuint64 i = 0; i < num_secs; i++)
		{
			ckcore::tuint64 offset = (extent_loc + i) * ISO9660_SECTOR_SIZE;
			if (!store.read_at(offset,buffer,ISO9660_SECTOR_SIZE))
			{
#ifdef _WINDOWS
				log_.print_line(ckT("  Error: Unable to read directory sector at offset %I64u."),offset);
#else
				log_.print_line(ckT("  Error: Unable to read directory sector at offset %llu."),offset);
#endif
				return RESULT_FAIL;
			}

			ckcore::tuint32 pos = 0;
			while (pos < ISO9660_SECTOR_SIZE)
			{
				DirRecord rec;
				DirRecord::DecodeResult dec_res = rec.decode(buffer + pos,ISO9660_SECTOR_SIZE - pos);
				if (dec_res == DirRecord::DECODE_END)
					break;

				if (dec_res == DirRecord::DECODE_MALFORMED ||
					!check_extent(rec.extent_loc_,rec.data_len_))
				{
#ifdef _WINDOWS
					log_.print_line(ckT("  Error: Malformed directory record at offset %I64u."),offset + pos);
#else
					log_.print_line(ckT("  Error: Malformed directory record at offset %llu."),offset + pos);
#endif
					return RESULT_MALFORMED;
				}

				listener.on_entry(rec,depth);

				if (rec.is_directory_ && !rec.is_self_or_parent())
				{
					int res = read_dir(store,listener,rec.extent_loc_,rec.data_len_,depth + 1);
					if (res != RESULT_OK)
						return res;
				}

				pos += rec.record_len_;
			}
		}

		return RESULT_OK;
	}

	/**
		Decodes the directory hierarchy of an image.
		@param store the image to read.
		@param listener receives every directory record.
		@return RESULT_OK on success, otherwise an error code.
	*/
	int Iso9660Reader::read(ImageStore &store,DirectoryListener &listener)
	{
		int res = read_voldesc(store);
		if (res != RESULT_OK)
			return res;

		return read_dir(store,listener,voldesc_.root_extent_loc_,voldesc_.root_extent_len_,0);
	}

	const VolumeDescriptor &Iso9660Reader::get_voldesc() const
	{
		return voldesc_;
	}
};
