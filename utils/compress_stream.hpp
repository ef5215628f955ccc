// -*- mode: c++ -*-
//
//  Copyright(C) 2009-2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __UTILS__COMPRESS_STREAM__HPP__
#define __UTILS__COMPRESS_STREAM__HPP__ 1

// file streams with transparent gzip/bzip2 (de)compression.
// "-" denotes stdin/stdout.

#include <cstring>
#include <iostream>
#include <fstream>
#include <string>

#include <unistd.h>

#include <boost/iostreams/filtering_stream.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filter/bzip2.hpp>
#include <boost/iostreams/device/file_descriptor.hpp>
#include <boost/iostreams/device/file.hpp>

#include <boost/filesystem.hpp>

namespace utils
{
  namespace impl
  {
    typedef enum {
      COMPRESS_STREAM_GZIP,
      COMPRESS_STREAM_BZIP,
      COMPRESS_STREAM_UNKNOWN
    } compress_format_type;

    // input format is detected by magic numbers
    inline
    compress_format_type compress_iformat(const boost::filesystem::path& path)
    {
      char buffer[4];

      ::memset(buffer, 0, sizeof(buffer));
      std::ifstream ifs(path.string().c_str());
      ifs.read(buffer, 3);

      if (buffer[0] == '\037' && buffer[1] == '\213')
	return COMPRESS_STREAM_GZIP;
      else if (buffer[0] == 'B' && buffer[1] == 'Z' && buffer[2] == 'h')
	return COMPRESS_STREAM_BZIP;
      else
	return COMPRESS_STREAM_UNKNOWN;
    }

    // output format is decided by the extension
    inline
    compress_format_type compress_oformat(const boost::filesystem::path& path)
    {
      const std::string extension = path.extension().string();

      if (extension == ".gz")
	return COMPRESS_STREAM_GZIP;
      else if (extension == ".bz2")
	return COMPRESS_STREAM_BZIP;
      else
	return COMPRESS_STREAM_UNKNOWN;
    }
  };

  class compress_ostream : public boost::iostreams::filtering_ostream
  {
  public:
    typedef boost::filesystem::path path_type;

  public:
    compress_ostream(const path_type& path, size_t buffer_size = 4096)
    {
      namespace io = boost::iostreams;

      if (path.string() == "-")
	push(io::file_descriptor_sink(::dup(STDOUT_FILENO), io::close_handle), buffer_size);
      else {
	switch (impl::compress_oformat(path)) {
	case impl::COMPRESS_STREAM_GZIP: push(io::gzip_compressor());  break;
	case impl::COMPRESS_STREAM_BZIP: push(io::bzip2_compressor()); break;
	default: break;
	}
	push(io::file_sink(path.string(), std::ios_base::out | std::ios_base::trunc), buffer_size);
      }
    }
  };

  class compress_istream : public boost::iostreams::filtering_istream
  {
  public:
    typedef boost::filesystem::path path_type;

  public:
    compress_istream(const path_type& path, size_t buffer_size = 4096)
    {
      namespace io = boost::iostreams;

      if (path.string() == "-")
	push(io::file_descriptor_source(::dup(STDIN_FILENO), io::close_handle), buffer_size);
      else {
	if (boost::filesystem::is_regular_file(path))
	  switch (impl::compress_iformat(path)) {
	  case impl::COMPRESS_STREAM_GZIP: push(io::gzip_decompressor());  break;
	  case impl::COMPRESS_STREAM_BZIP: push(io::bzip2_decompressor()); break;
	  default: break;
	  }
	push(io::file_source(path.string()), buffer_size);
      }
    }
  };
};

#endif
