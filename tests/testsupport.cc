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

#include <stdarg.h>
#include <stdio.h>
#include <ckiso/const.hh>
#include "testsupport.hh"

namespace ckiso
{
	namespace test
	{
		static std::string format_args(const char *format,va_list args)
		{
			char buffer[1024];
			vsnprintf(buffer,sizeof(buffer),format,args);
			return buffer;
		}

		void TestLog::print(const ckcore::tchar *format,...)
		{
			va_list args;
			va_start(args,format);
			cur_line_ += format_args(format,args);
			va_end(args);
		}

		void TestLog::print_line(const ckcore::tchar *format,...)
		{
			va_list args;
			va_start(args,format);
			cur_line_ += format_args(format,args);
			va_end(args);

			lines_.push_back(cur_line_);
			cur_line_.clear();
		}

		bool TestLog::contains(const std::string &str) const
		{
			for (size_t i = 0; i < lines_.size(); i++)
			{
				if (lines_[i].find(str) != std::string::npos)
					return true;
			}

			return false;
		}

		void TestProgress::set_progress(unsigned char progress)
		{
			percentages_.push_back(progress);
		}

		void TestProgress::set_marquee(bool marquee)
		{
		}

		void TestProgress::set_status(const ckcore::tchar *format,...)
		{
		}

		void TestProgress::notify(MessageType type,const ckcore::tchar *format,...)
		{
			va_list args;
			va_start(args,format);
			std::string message = format_args(format,args);
			va_end(args);

			if (type == ckERROR)
				errors_.push_back(message);
			else
				warnings_.push_back(message);
		}

		bool TestProgress::cancelled()
		{
			return false;
		}

		class MemorySourceFile : public SourceFile
		{
		private:
			std::string content_;
			size_t pos_;

		public:
			MemorySourceFile(const std::string &content) : content_(content),pos_(0) {}

			ckcore::tuint64 size()
			{
				return content_.size();
			}

			ckcore::tint64 read(void *buffer,ckcore::tuint32 count)
			{
				size_t remaining = content_.size() - pos_;
				size_t len = count < remaining ? count : remaining;

				content_.copy((char *)buffer,len,pos_);
				pos_ += len;
				return (ckcore::tint64)len;
			}
		};

		MemorySourceTree::MemorySourceTree()
		{
			nodes_[""] = Node();
		}

		MemorySourceTree::Node &MemorySourceTree::add_node(const std::string &path)
		{
			size_t delim = path.rfind('/');
			std::string parent_path = path.substr(0,delim);

			nodes_[parent_path].children_.push_back(path.substr(delim + 1));
			return nodes_[path];
		}

		void MemorySourceTree::add_dir(const std::string &path)
		{
			add_node(path).is_directory_ = true;
		}

		void MemorySourceTree::add_file(const std::string &path,const std::string &content)
		{
			Node &node = add_node(path);
			node.is_directory_ = false;
			node.content_ = content;
		}

		void MemorySourceTree::add_special(const std::string &path)
		{
			Node &node = add_node(path);
			node.is_directory_ = false;
			node.is_special_ = true;
		}

		void MemorySourceTree::deny(const std::string &path,int from_access)
		{
			nodes_[path].deny_from_ = from_access;
		}

		void MemorySourceTree::fail(const std::string &path)
		{
			nodes_[path].fail_ = true;
		}

		int MemorySourceTree::accesses(const std::string &path) const
		{
			std::map<std::string,Node>::const_iterator it = nodes_.find(path);
			return it == nodes_.end() ? 0 : it->second.accesses_;
		}

		MemorySourceTree::Node *MemorySourceTree::access(const std::string &path,int &res)
		{
			std::map<std::string,Node>::iterator it = nodes_.find(path);
			if (it == nodes_.end() || it->second.fail_)
			{
				res = RESULT_FAIL;
				return NULL;
			}

			Node &node = it->second;
			int access_index = node.accesses_++;
			if (node.deny_from_ != -1 && access_index >= node.deny_from_)
			{
				res = RESULT_ACCESS_DENIED;
				return NULL;
			}

			res = RESULT_OK;
			return &node;
		}

		int MemorySourceTree::list(const ckcore::tstring &dir_path,std::vector<SourceEntry> &entries)
		{
			int res = RESULT_OK;
			Node *node = access(dir_path,res);
			if (node == NULL)
				return res;

			if (!node->is_directory_)
				return RESULT_FAIL;

			for (size_t i = 0; i < node->children_.size(); i++)
			{
				const Node &child = nodes_[dir_path + "/" + node->children_[i]];
				entries.push_back(SourceEntry(node->children_[i],child.is_directory_,
											  child.is_special_));
			}

			return RESULT_OK;
		}

		int MemorySourceTree::open_file(const ckcore::tstring &file_path,SourceFile *&file)
		{
			int res = RESULT_OK;
			Node *node = access(file_path,res);
			if (node == NULL)
				return res;

			if (node->is_directory_ || node->is_special_)
				return RESULT_FAIL;

			file = new MemorySourceFile(node->content_);
			return RESULT_OK;
		}

		void RecordingListener::on_entry(const DirRecord &rec,int depth)
		{
			Entry entry;
			entry.ident_ = rec.ident_;
			entry.is_directory_ = rec.is_directory_;
			entry.extent_loc_ = rec.extent_loc_;
			entry.data_len_ = rec.data_len_;
			entry.depth_ = depth;

			entries_.push_back(entry);
		}

		const RecordingListener::Entry *RecordingListener::find(const std::string &ident,int depth) const
		{
			for (size_t i = 0; i < entries_.size(); i++)
			{
				if (entries_[i].ident_ == ident && entries_[i].depth_ == depth)
					return &entries_[i];
			}

			return NULL;
		}

		size_t RecordingListener::count(int depth) const
		{
			size_t res = 0;
			for (size_t i = 0; i < entries_.size(); i++)
			{
				if (entries_[i].depth_ == depth)
					res++;
			}

			return res;
		}
	};
};
