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
#include <ckcore/types.hh>
#include <ckcore/log.hh>
#include "ckiso/voldesc.hh"
#include "ckiso/dirrecord.hh"
#include "ckiso/imagestore.hh"

namespace ckiso
{
	/**
		Receives the directory records of an image in depth-first order. The
		"." and ".." records are reported like any other record.
	*/
	class DirectoryListener
	{
	public:
		virtual ~DirectoryListener() {};

		virtual void on_entry(const DirRecord &rec,int depth) = 0;
	};

	/**
		Prints the hierarchy of an image to a log, four spaces of indentation
		per level.
	*/
	class LogListing : public DirectoryListener
	{
	private:
		ckcore::Log &log_;

	public:
		LogListing(ckcore::Log &log);

		void on_entry(const DirRecord &rec,int depth);
	};

	class Iso9660Reader
	{
	private:
		ckcore::Log &log_;
		VolumeDescriptor voldesc_;

		int read_voldesc(ImageStore &store);
		int read_dir(ImageStore &store,DirectoryListener &listener,
					 ckcore::tuint32 extent_loc,ckcore::tuint32 extent_len,int depth);
		bool check_extent(ckcore::tuint32 extent_loc,ckcore::tuint32 extent_len) const;

	public:
		Iso9660Reader(ckcore::Log &log);
		~Iso9660Reader();

		int read(ImageStore &store,DirectoryListener &listener);

		const VolumeDescriptor &get_voldesc() const;
	};
};
