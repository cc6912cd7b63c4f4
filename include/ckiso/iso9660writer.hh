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
#include <vector>
#include <ckcore/types.hh>
#include <ckcore/log.hh>
#include <ckcore/progress.hh>
#include "ckiso/iso9660.hh"
#include "ckiso/blockallocator.hh"
#include "ckiso/imagestore.hh"
#include "ckiso/sourcetree.hh"

#define ISO9660WRITER_CHUNK_SIZE			0x10000

namespace ckiso
{
	/**
		A listed child of a directory that is being written.
	*/
	class DirectoryNode
	{
	public:
		ckcore::tstring file_name_;
		std::string ident_;				// Including version information.
		bool is_directory_;
		ckcore::tuint32 extent_loc_;
		ckcore::tuint32 extent_len_;

		DirectoryNode(const ckcore::tstring &file_name,const std::string &ident,
					  bool is_directory) :
			file_name_(file_name),ident_(ident),is_directory_(is_directory),
			extent_loc_(0),extent_len_(0) {}
	};

	/**
		Reports the number of written bytes as a percentage of the expected
		total. The reported value never decreases and never exceeds 100.
	*/
	class ProgressTracker
	{
	private:
		ckcore::Progress &progress_;
		ckcore::tuint64 total_;
		ckcore::tuint64 written_;
		unsigned char last_percent_;

	public:
		ProgressTracker(ckcore::Progress &progress,ckcore::tuint64 total);

		void update(ckcore::tuint64 written);
		void finish();
	};

	class Iso9660Writer
	{
	private:
		ckcore::Log &log_;
		Iso9660 iso9660_;
		struct tm create_time_;

		ckcore::tstring make_path(const ckcore::tstring &dir_path,
							  const ckcore::tstring &file_name) const;

		void skip_access_denied(ckcore::Progress &progress,const ckcore::tstring &path);
		void skip_deep_dir(ckcore::Progress &progress,const ckcore::tstring &path);

		int list_dir(SourceTree &source,ckcore::Progress &progress,
					 const ckcore::tstring &dir_path,bool report,
					 std::vector<DirectoryNode> &nodes);
		ckcore::tuint32 calc_dir_len(const std::vector<DirectoryNode> &nodes) const;

		int calc_local_size(SourceTree &source,ckcore::Progress &progress,
							const ckcore::tstring &dir_path,int level,bool report,
							std::vector<DirectoryNode> &nodes,
							ckcore::tuint64 &total_bytes,ckcore::tuint64 &total_secs);
		int calc_tree_size(SourceTree &source,ckcore::Progress &progress,bool report,
						   ckcore::tuint64 &total_bytes,ckcore::tuint64 &total_secs);

		bool append_record(std::vector<unsigned char> &dir_data,ckcore::tuint32 &pos,
						   const std::string &ident,ckcore::tuint32 extent_loc,
						   ckcore::tuint32 extent_len,bool is_directory);

		int write_voldesc(ImageStore &store,ckcore::tuint64 vol_space_size,
						  ckcore::tuint32 root_loc,ckcore::tuint32 root_len);
		int write_file(SourceTree &source,ImageStore &store,ckcore::Progress &progress,
					   BlockAllocator &allocator,ProgressTracker &tracker,
					   const ckcore::tstring &file_path,DirectoryNode &node,bool &included);
		int write_local_dir(SourceTree &source,ImageStore &store,ckcore::Progress &progress,
							BlockAllocator &allocator,ProgressTracker &tracker,
							const ckcore::tstring &dir_path,int level,
							std::vector<DirectoryNode> &nodes,
							ckcore::tuint32 dir_loc,ckcore::tuint32 dir_len,
							ckcore::tuint32 parent_loc,ckcore::tuint32 parent_len);
		bool check_space(ckcore::Progress &progress,BlockAllocator &allocator);

		int fail(int res,ImageStore &store);

	public:
		Iso9660Writer(ckcore::Log &log);
		~Iso9660Writer();

		int calc_size(SourceTree &source,ckcore::Progress &progress,
					  ckcore::tuint64 &total_bytes,ckcore::tuint64 &total_secs);
		int write(SourceTree &source,ImageStore &store,ckcore::Progress &progress);

		// Change of internal state functions.
		void set_volume_label(const ckcore::tchar *label);
		void set_text_fields(const ckcore::tchar *sys_ident,const ckcore::tchar *volset_ident,
							 const ckcore::tchar *publ_ident,const ckcore::tchar *prep_ident);
		void set_interchange_level(Iso9660::InterLevel inter_level);
		void set_include_file_ver_info(bool include);
		void set_relax_max_dir_level(bool relax);
		void set_create_time(const struct tm &create_time);
	};
};
