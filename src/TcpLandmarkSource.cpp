#include "TcpLandmarkSource.hpp"
#include "LandmarkJson.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <istream>
#include <string>

namespace asio = boost::asio;
using asio::ip::tcp;
using json = nlohmann::json;

TcpLandmarkSource::TcpLandmarkSource(const std::string& host, const std::string& port)
  : socket_(io_) {
  tcp::resolver resolver(io_);
  asio::connect(socket_, resolver.resolve(host, port));
  spdlog::info("Connected to landmark stream {}:{}", host, port);
}

bool TcpLandmarkSource::next(LandmarkFrame& out) {
  for (;;) {
    boost::system::error_code ec;
    asio::read_until(socket_, buffer_, '\n', ec);
    // A final line without '\n' is still delivered before eof.
    if (ec && buffer_.size() == 0) {
      if (ec != asio::error::eof) {
        spdlog::warn("Landmark stream closed: {}", ec.message());
      }
      return false;
    }

    std::istream is(&buffer_);
    std::string line;
    std::getline(is, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;

    out = LandmarkFrame{};
    out.index = next_index_;

    json j = json::parse(line, nullptr, false);
    std::string why;
    if (j.is_discarded()) {
      why = "invalid JSON";
    }
    if (!why.empty() || !frameFromJson(j, out, why)) {
      ++bad_lines_;
      spdlog::warn("Unreadable landmark line: {}", why);
      out.joints.clear();
    }
    next_index_ = out.index + 1;
    return true;
  }
}
