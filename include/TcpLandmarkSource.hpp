#pragma once
#include "ILandmarkSource.hpp"

#include <boost/asio.hpp>

#include <cstdint>
#include <string>

// Reads newline-delimited JSON frames from a pose-estimation process over TCP.
// Unparsable lines come back as empty frames (malformed for the analyzer)
// rather than ending the stream.
class TcpLandmarkSource : public ILandmarkSource {
public:
  // Throws boost::system::system_error if the connection fails.
  TcpLandmarkSource(const std::string& host, const std::string& port);

  bool next(LandmarkFrame& out) override;

  int64_t badLines() const { return bad_lines_; }

private:
  boost::asio::io_context io_;
  boost::asio::ip::tcp::socket socket_;
  boost::asio::streambuf buffer_;

  int64_t next_index_ = 0;
  int64_t bad_lines_ = 0;
};
