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

#include <set>
#include <string.h>
#include "ckiso/const.hh"
#include "ckiso/stringtable.hh"
#include "ckiso/voldesc.hh"
#include "ckiso/dirrecord.hh"
#include "ckiso/iso9660writer.hh"

namespace ckiso
{
	ProgressTracker::ProgressTracker(ckcore::Progress &progress,ckcore::tuint64 total) :
		progress_(progress),total_(total),written_(0),last_percent_(0)
	{
		progress_.set_progress(0);
	}

	void ProgressTracker::update(ckcore::tuint64 written)
	{
		written_ += written;

		ckcore::tuint64 percent = 100;
		if (total_ > 0 && written_ < total_)
			percent = (written_ * 100) / total_;

		if (percent > last_percent_)
		{
			last_percent_ = (unsigned char)percent;
			progress_.set_progress(last_percent_);
		}
	}

	void ProgressTracker::finish()
	{
		if (last_percent_ < 100)
		{
			last_percent_ = 100;
			progress_.set_progress(last_percent_);
		}
	}

	Iso9660Writer::Iso9660Writer(ckcore::Log &log) : log_(log)
	{
		time_t cur_time;
		time(&cur_time);
		create_time_ = *localtime(&cur_time);
	}

	Iso9660Writer::~Iso9660Writer()
	{
	}

	ckcore::tstring Iso9660Writer::make_path(const ckcore::tstring &dir_path,
											 const ckcore::tstring &file_name) const
	{
		return dir_path + ckT("/") + file_name;
	}

	void Iso9660Writer::skip_access_denied(ckcore::Progress &progress,const ckcore::tstring &path)
	{
		log_.print_line(ckT("  Warning: Skipping \"%s\", access denied."),path.c_str());
		progress.notify(ckcore::Progress::ckWARNING,
			StringTable::instance().get_string(WARNING_SKIPACCESS),path.c_str());
	}

	void Iso9660Writer::skip_deep_dir(ckcore::Progress &progress,const ckcore::tstring &path)
	{
		log_.print_line(ckT("  Warning: Skipping \"%s\", the directory structure is deeper than %d levels."),
			path.c_str(),(int)iso9660_.get_max_dir_level());
		progress.notify(ckcore::Progress::ckWARNING,
			StringTable::instance().get_string(WARNING_SKIPDIRLEVEL),path.c_str(),
			(int)iso9660_.get_max_dir_level());
	}

	/*
		Lists the directory and assigns each child a unique identifier. The
		root directory can not be skipped so access denied is a failure there.
		Warnings are only given if report is true.
	*/
	int Iso9660Writer::list_dir(SourceTree &source,ckcore::Progress &progress,
								const ckcore::tstring &dir_path,bool report,
								std::vector<DirectoryNode> &nodes)
	{
		std::vector<SourceEntry> entries;
		int res = source.list(dir_path,entries);
		if (res == RESULT_ACCESS_DENIED && !dir_path.empty())
		{
			if (report)
				skip_access_denied(progress,dir_path);
			return res;
		}

		if (res != RESULT_OK)
		{
			const ckcore::tchar *display_path = dir_path.empty() ? ckT("/") : dir_path.c_str();

			log_.print_line(ckT("  Error: Unable to list the contents of \"%s\"."),display_path);
			progress.notify(ckcore::Progress::ckERROR,
				StringTable::instance().get_string(ERROR_LISTDIR),display_path);
			return RESULT_FAIL;
		}

		std::set<std::string> used;

		std::vector<SourceEntry>::const_iterator it;
		for (it = entries.begin(); it != entries.end(); it++)
		{
			if (it->is_special_)
			{
				if (report)
				{
					ckcore::tstring path = make_path(dir_path,it->name_);

					log_.print_line(ckT("  Warning: Skipping \"%s\", not a regular file or directory."),
						path.c_str());
					progress.notify(ckcore::Progress::ckWARNING,
						StringTable::instance().get_string(WARNING_SKIPSPECIAL),path.c_str());
				}
				continue;
			}

			std::string ident = iso9660_.make_ident(it->name_,it->is_directory_);
			if (!iso9660_.make_unique(ident,used,it->is_directory_) && report)
			{
				ckcore::tstring path = make_path(dir_path,it->name_);

				log_.print_line(ckT("  Warning: Unable to calculate unique ISO9660 name for %s. Duplicate file names will exist in ISO9660 file system."),
					path.c_str());
				progress.notify(ckcore::Progress::ckWARNING,
					StringTable::instance().get_string(WARNING_DUPLICATENAME),path.c_str());
			}

			used.insert(ident);
			nodes.push_back(DirectoryNode(it->name_,ident,it->is_directory_));
		}

		return RESULT_OK;
	}

	static void add_record_len(ckcore::tuint32 &pos,unsigned char rec_len)
	{
		// Records may not cross sector boundaries.
		if (pos % ISO9660_SECTOR_SIZE + rec_len > ISO9660_SECTOR_SIZE)
			pos += ISO9660_SECTOR_SIZE - pos % ISO9660_SECTOR_SIZE;

		pos += rec_len;
	}

	/*
		Returns the number of bytes needed for the records of a directory with
		the specified children, including the "." and ".." records.
	*/
	ckcore::tuint32 Iso9660Writer::calc_dir_len(const std::vector<DirectoryNode> &nodes) const
	{
		ckcore::tuint32 len = 0;
		add_record_len(len,DirRecord::calc_len(1));
		add_record_len(len,DirRecord::calc_len(2));

		std::vector<DirectoryNode>::const_iterator it;
		for (it = nodes.begin(); it != nodes.end(); it++)
			add_record_len(len,DirRecord::calc_len(it->ident_.length()));

		return len;
	}

	int Iso9660Writer::calc_local_size(SourceTree &source,ckcore::Progress &progress,
									   const ckcore::tstring &dir_path,int level,bool report,
									   std::vector<DirectoryNode> &nodes,
									   ckcore::tuint64 &total_bytes,ckcore::tuint64 &total_secs)
	{
		total_secs += bytes_to_sec(calc_dir_len(nodes));

		std::vector<DirectoryNode>::iterator it;
		for (it = nodes.begin(); it != nodes.end(); it++)
		{
			ckcore::tstring path = make_path(dir_path,it->file_name_);

			if (it->is_directory_)
			{
				if (level >= iso9660_.get_max_dir_level())
				{
					if (report)
						skip_deep_dir(progress,path);
					continue;
				}

				std::vector<DirectoryNode> child_nodes;
				int res = list_dir(source,progress,path,report,child_nodes);
				if (res == RESULT_ACCESS_DENIED)
					continue;
				if (res != RESULT_OK)
					return res;

				res = calc_local_size(source,progress,path,level + 1,report,child_nodes,
									  total_bytes,total_secs);
				if (res != RESULT_OK)
					return res;
			}
			else
			{
				SourceFile *file = NULL;
				int res = source.open_file(path,file);
				if (res == RESULT_ACCESS_DENIED)
				{
					if (report)
						skip_access_denied(progress,path);
					continue;
				}

				if (res != RESULT_OK)
				{
					log_.print_line(ckT("  Error: Unable to obtain file handle to \"%s\"."),path.c_str());
					progress.notify(ckcore::Progress::ckERROR,
						StringTable::instance().get_string(ERROR_OPENREAD),path.c_str());
					return RESULT_FAIL;
				}

				ckcore::tuint64 file_size = file->size();
				delete file;

				// Reported when the file data is written.
				if (file_size > ISO9660_MAX_EXTENT_SIZE)
					continue;

				total_bytes += file_size;
				total_secs += bytes_to_sec(file_size);
			}
		}

		return RESULT_OK;
	}

	int Iso9660Writer::calc_tree_size(SourceTree &source,ckcore::Progress &progress,bool report,
									  ckcore::tuint64 &total_bytes,ckcore::tuint64 &total_secs)
	{
		progress.set_status(StringTable::instance().get_string(STATUS_CALCSIZE));
		progress.set_marquee(true);

		total_bytes = 0;
		total_secs = ISO9660_FIRST_DATA_SEC;

		std::vector<DirectoryNode> root_nodes;
		int res = list_dir(source,progress,ckT(""),report,root_nodes);
		if (res != RESULT_OK)
			return res;

		return calc_local_size(source,progress,ckT(""),1,report,root_nodes,total_bytes,total_secs);
	}

	/**
		Calculates the number of file data bytes and the number of sectors an
		image of the source tree is expected to occupy. Entries that can not
		be accessed, and directories deeper than the maximum level, are not
		included.
	*/
	int Iso9660Writer::calc_size(SourceTree &source,ckcore::Progress &progress,
								 ckcore::tuint64 &total_bytes,ckcore::tuint64 &total_secs)
	{
		return calc_tree_size(source,progress,true,total_bytes,total_secs);
	}

	bool Iso9660Writer::append_record(std::vector<unsigned char> &dir_data,ckcore::tuint32 &pos,
									  const std::string &ident,ckcore::tuint32 extent_loc,
									  ckcore::tuint32 extent_len,bool is_directory)
	{
		DirRecord rec(ident,extent_loc,extent_len,is_directory);
		rec.set_timestamp(create_time_);

		ckcore::tuint32 rec_pos = pos;
		add_record_len(rec_pos,rec.record_len_);
		rec_pos -= rec.record_len_;

		if (rec.record_len_ == 0 || rec_pos + rec.record_len_ > dir_data.size())
			return false;

		if (rec.encode(&dir_data[rec_pos]) != rec.record_len_)
			return false;

		pos = rec_pos + rec.record_len_;
		return true;
	}

	int Iso9660Writer::write_voldesc(ImageStore &store,ckcore::tuint64 vol_space_size,
									 ckcore::tuint32 root_loc,ckcore::tuint32 root_len)
	{
		VolumeDescriptor voldesc;
		voldesc.vol_space_size_ = vol_space_size > ISO9660_MAX_SECTORS ?
			ISO9660_MAX_SECTORS : (ckcore::tuint32)vol_space_size;
		voldesc.root_extent_loc_ = root_loc;
		voldesc.root_extent_len_ = root_len;
		voldesc.sys_ident_ = iso9660_.get_sys_ident();
		voldesc.vol_ident_ = iso9660_.get_volume_label();
		voldesc.volset_ident_ = iso9660_.get_volset_ident();
		voldesc.publ_ident_ = iso9660_.get_publ_ident();
		voldesc.prep_ident_ = iso9660_.get_prep_ident();
		voldesc.create_time_ = create_time_;

		unsigned char buffer[ISO9660_SECTOR_SIZE];
		voldesc.encode(buffer);

		if (!store.write_at((ckcore::tuint64)ISO9660_VOLDESC_SEC * ISO9660_SECTOR_SIZE,
							buffer,ISO9660_SECTOR_SIZE))
		{
			log_.print_line(ckT("  Error: Failed to write primary volume descriptor."));
			return RESULT_FAIL;
		}

		return RESULT_OK;
	}

	bool Iso9660Writer::check_space(ckcore::Progress &progress,BlockAllocator &allocator)
	{
		if (allocator.get_next_free() > ISO9660_MAX_SECTORS)
		{
#ifdef _WINDOWS
			log_.print_line(ckT("  Error: The disc image is too large (%I64u sectors)."),
#else
			log_.print_line(ckT("  Error: The disc image is too large (%llu sectors)."),
#endif
				allocator.get_next_free());
			progress.notify(ckcore::Progress::ckERROR,
				StringTable::instance().get_string(ERROR_IMAGESIZE));
			return false;
		}

		return true;
	}

	/*
		Copies a file into a newly allocated extent. included is set to false
		if the file was skipped, no space is allocated in that case.
	*/
	int Iso9660Writer::write_file(SourceTree &source,ImageStore &store,ckcore::Progress &progress,
								  BlockAllocator &allocator,ProgressTracker &tracker,
								  const ckcore::tstring &file_path,DirectoryNode &node,bool &included)
	{
		included = false;

		SourceFile *file = NULL;
		int res = source.open_file(file_path,file);
		if (res == RESULT_ACCESS_DENIED)
		{
			skip_access_denied(progress,file_path);
			return RESULT_OK;
		}

		if (res != RESULT_OK)
		{
			log_.print_line(ckT("  Error: Unable to obtain file handle to \"%s\"."),file_path.c_str());
			progress.notify(ckcore::Progress::ckERROR,
				StringTable::instance().get_string(ERROR_OPENREAD),file_path.c_str());
			return RESULT_FAIL;
		}

		ckcore::tuint64 file_size = file->size();
		if (file_size > ISO9660_MAX_EXTENT_SIZE)
		{
			log_.print_line(ckT("  Warning: Skipping \"%s\", the file is larger than 4 GiB."),
				file_path.c_str());
			progress.notify(ckcore::Progress::ckWARNING,
				StringTable::instance().get_string(WARNING_SKIP4GFILE),file_path.c_str());

			delete file;
			return RESULT_OK;
		}

		ckcore::tuint64 extent_loc = allocator.allocate_bytes(file_size);
		if (!check_space(progress,allocator))
		{
			delete file;
			return RESULT_FAIL;
		}

		node.extent_loc_ = (ckcore::tuint32)extent_loc;
		node.extent_len_ = (ckcore::tuint32)file_size;

		ckcore::tuint64 offset = extent_loc * ISO9660_SECTOR_SIZE;
		ckcore::tuint64 remaining = file_size;

		std::vector<unsigned char> buffer(ISO9660WRITER_CHUNK_SIZE);
		while (remaining > 0)
		{
			ckcore::tuint32 count = remaining > ISO9660WRITER_CHUNK_SIZE ?
				ISO9660WRITER_CHUNK_SIZE : (ckcore::tuint32)remaining;

			ckcore::tint64 processed = file->read(&buffer[0],count);
			if (processed <= 0)
			{
#ifdef _WINDOWS
				log_.print_line(ckT("  Error: Unable to read from \"%s\", %I64u bytes remaining."),
#else
				log_.print_line(ckT("  Error: Unable to read from \"%s\", %llu bytes remaining."),
#endif
					file_path.c_str(),remaining);
				delete file;
				return RESULT_FAIL;
			}

			if (!store.write_at(offset,&buffer[0],(ckcore::tuint32)processed))
			{
#ifdef _WINDOWS
				log_.print_line(ckT("  Error: Unable to write \"%s\" to disc image offset %I64u."),
#else
				log_.print_line(ckT("  Error: Unable to write \"%s\" to disc image offset %llu."),
#endif
					file_path.c_str(),offset);
				delete file;
				return RESULT_FAIL;
			}

			offset += processed;
			remaining -= processed;
			tracker.update(processed);
		}

		delete file;

		// Pad the sector.
		ckcore::tuint32 tail = (ckcore::tuint32)(file_size % ISO9660_SECTOR_SIZE);
		if (tail != 0)
		{
			memset(&buffer[0],0,ISO9660_SECTOR_SIZE - tail);
			if (!store.write_at(offset,&buffer[0],ISO9660_SECTOR_SIZE - tail))
			{
				log_.print_line(ckT("  Error: Unable to pad the last sector of \"%s\"."),
					file_path.c_str());
				return RESULT_FAIL;
			}
		}

		included = true;
		return RESULT_OK;
	}

	/*
		Writes the children of a directory followed by the directory records
		themselves. The directory extent has already been allocated.
	*/
	int Iso9660Writer::write_local_dir(SourceTree &source,ImageStore &store,ckcore::Progress &progress,
									   BlockAllocator &allocator,ProgressTracker &tracker,
									   const ckcore::tstring &dir_path,int level,
									   std::vector<DirectoryNode> &nodes,
									   ckcore::tuint32 dir_loc,ckcore::tuint32 dir_len,
									   ckcore::tuint32 parent_loc,ckcore::tuint32 parent_len)
	{
		std::vector<unsigned char> dir_data(dir_len,0);
		ckcore::tuint32 pos = 0;

		if (!append_record(dir_data,pos,".",dir_loc,dir_len,true) ||
			!append_record(dir_data,pos,"..",parent_loc,parent_len,true))
		{
			log_.print_line(ckT("  Error: Unable to write system directory records of \"%s\"."),
				dir_path.c_str());
			return RESULT_FAIL;
		}

		std::vector<DirectoryNode>::iterator it;
		for (it = nodes.begin(); it != nodes.end(); it++)
		{
			ckcore::tstring path = make_path(dir_path,it->file_name_);

			if (it->is_directory_)
			{
				if (level >= iso9660_.get_max_dir_level())
				{
					skip_deep_dir(progress,path);
					continue;
				}

				std::vector<DirectoryNode> child_nodes;
				int res = list_dir(source,progress,path,true,child_nodes);
				if (res == RESULT_ACCESS_DENIED)
					continue;
				if (res != RESULT_OK)
					return res;

				ckcore::tuint32 child_len = calc_dir_len(child_nodes);
				ckcore::tuint64 child_loc = allocator.allocate_bytes(child_len);
				if (!check_space(progress,allocator))
					return RESULT_FAIL;

				it->extent_loc_ = (ckcore::tuint32)child_loc;
				it->extent_len_ = (ckcore::tuint32)bytes_to_sec(child_len) * ISO9660_SECTOR_SIZE;

				res = write_local_dir(source,store,progress,allocator,tracker,path,level + 1,
									  child_nodes,it->extent_loc_,it->extent_len_,dir_loc,dir_len);
				if (res != RESULT_OK)
					return res;
			}
			else
			{
				bool included = false;
				int res = write_file(source,store,progress,allocator,tracker,path,*it,included);
				if (res != RESULT_OK)
					return res;

				if (!included)
					continue;
			}

			if (!append_record(dir_data,pos,it->ident_,it->extent_loc_,it->extent_len_,
							   it->is_directory_))
			{
				log_.print_line(ckT("  Error: Unable to write directory record for \"%s\"."),
					path.c_str());
				return RESULT_FAIL;
			}
		}

		if (!store.write_at((ckcore::tuint64)dir_loc * ISO9660_SECTOR_SIZE,&dir_data[0],dir_len))
		{
			log_.print_line(ckT("  Error: Unable to write directory records to sector %u."),dir_loc);
			return RESULT_FAIL;
		}

		return RESULT_OK;
	}

	/*
		Should be called when the write operation fails so that the broken
		image can not be mistaken for a valid one.
	*/
	int Iso9660Writer::fail(int res,ImageStore &store)
	{
		unsigned char buffer[ISO9660_SECTOR_SIZE];
		memset(buffer,0,sizeof(buffer));

		if (!store.write_at((ckcore::tuint64)ISO9660_VOLDESC_SEC * ISO9660_SECTOR_SIZE,
							buffer,ISO9660_SECTOR_SIZE))
		{
			log_.print_line(ckT("  Error: Unable to invalidate the primary volume descriptor."));
		}

		return res;
	}

	/**
		Builds an ISO9660 image of the source tree.
		@param source the files and directories to include.
		@param store the store to write the image to.
		@param progress receives progress and warnings about skipped entries.
		@return RESULT_OK on success, otherwise an error code.
	*/
	int Iso9660Writer::write(SourceTree &source,ImageStore &store,ckcore::Progress &progress)
	{
		// Warnings are given by the write pass, which decides what is included.
		ckcore::tuint64 total_bytes = 0,total_secs = 0;
		int res = calc_tree_size(source,progress,false,total_bytes,total_secs);
		if (res != RESULT_OK)
			return fail(res,store);

#ifdef _WINDOWS
		log_.print_line(ckT("  Estimated %I64u sectors, %I64u bytes of file data."),total_secs,total_bytes);
#else
		log_.print_line(ckT("  Estimated %llu sectors, %llu bytes of file data."),total_secs,total_bytes);
#endif

		progress.set_status(StringTable::instance().get_string(STATUS_WRITEDATA));
		progress.set_marquee(false);

		ProgressTracker tracker(progress,total_bytes);

		// System area.
		unsigned char buffer[ISO9660_SECTOR_SIZE];
		memset(buffer,0,sizeof(buffer));

		for (ckcore::tuint64 i = 0; i < ISO9660_VOLDESC_SEC; i++)
		{
			if (!store.write_at(i * ISO9660_SECTOR_SIZE,buffer,ISO9660_SECTOR_SIZE))
			{
				log_.print_line(ckT("  Error: Failed to write system area."));
				return fail(RESULT_FAIL,store);
			}
		}

		std::vector<DirectoryNode> root_nodes;
		res = list_dir(source,progress,ckT(""),true,root_nodes);
		if (res != RESULT_OK)
			return fail(res,store);

		BlockAllocator allocator(ISO9660_FIRST_DATA_SEC);

		ckcore::tuint32 root_len = calc_dir_len(root_nodes);
		ckcore::tuint32 root_loc = (ckcore::tuint32)allocator.allocate_bytes(root_len);
		root_len = (ckcore::tuint32)bytes_to_sec(root_len) * ISO9660_SECTOR_SIZE;

		res = write_voldesc(store,total_secs,root_loc,root_len);
		if (res != RESULT_OK)
			return fail(res,store);

		VolumeDescriptor::encode_terminator(buffer);
		if (!store.write_at((ckcore::tuint64)ISO9660_SETTERM_SEC * ISO9660_SECTOR_SIZE,
							buffer,ISO9660_SECTOR_SIZE))
		{
			log_.print_line(ckT("  Error: Failed to write volume descriptor set terminator."));
			return fail(RESULT_FAIL,store);
		}

		res = write_local_dir(source,store,progress,allocator,tracker,ckT(""),1,root_nodes,
							  root_loc,root_len,root_loc,root_len);
		if (res != RESULT_OK)
			return fail(res,store);

		// The estimate is replaced by the actual number of sectors.
		ckcore::tuint64 vol_space_size = allocator.get_next_free();
		res = write_voldesc(store,vol_space_size,root_loc,root_len);
		if (res != RESULT_OK)
			return fail(res,store);

		ckcore::tuint64 image_size = vol_space_size * ISO9660_SECTOR_SIZE;
		if (store.size() < image_size)
		{
			unsigned char zero = 0;
			if (!store.write_at(image_size - 1,&zero,1))
			{
				log_.print_line(ckT("  Error: Failed to pad the disc image."));
				return fail(RESULT_FAIL,store);
			}
		}

		tracker.finish();

#ifdef _WINDOWS
		log_.print_line(ckT("  Wrote %I64u sectors."),vol_space_size);
#else
		log_.print_line(ckT("  Wrote %llu sectors."),vol_space_size);
#endif
		return RESULT_OK;
	}

	void Iso9660Writer::set_volume_label(const ckcore::tchar *label)
	{
		iso9660_.set_volume_label(label);
	}

	void Iso9660Writer::set_text_fields(const ckcore::tchar *sys_ident,
										const ckcore::tchar *volset_ident,
										const ckcore::tchar *publ_ident,
										const ckcore::tchar *prep_ident)
	{
		iso9660_.set_text_fields(sys_ident,volset_ident,publ_ident,prep_ident);
	}

	void Iso9660Writer::set_interchange_level(Iso9660::InterLevel inter_level)
	{
		iso9660_.set_interchange_level(inter_level);
	}

	void Iso9660Writer::set_include_file_ver_info(bool include)
	{
		iso9660_.set_include_file_ver_info(include);
	}

	void Iso9660Writer::set_relax_max_dir_level(bool relax)
	{
		iso9660_.set_relax_max_dir_level(relax);
	}

	void Iso9660Writer::set_create_time(const struct tm &create_time)
	{
		create_time_ = create_time;
	}
};
