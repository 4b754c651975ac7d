#include "canal/http/http_types.h"

#include <algorithm>
#include <cctype>

namespace canal {
namespace http {

const char* httpMethodToString(HttpMethod method) {
  switch (method) {
    case HttpMethod::GET: return "GET";
    case HttpMethod::POST: return "POST";
    case HttpMethod::PUT: return "PUT";
    case HttpMethod::DELETE: return "DELETE";
    case HttpMethod::HEAD: return "HEAD";
    case HttpMethod::OPTIONS: return "OPTIONS";
    case HttpMethod::PATCH: return "PATCH";
    case HttpMethod::CONNECT: return "CONNECT";
    case HttpMethod::TRACE: return "TRACE";
    default: return "UNKNOWN";
  }
}

HttpMethod httpMethodFromString(const std::string& method) {
  if (method == "GET") return HttpMethod::GET;
  if (method == "POST") return HttpMethod::POST;
  if (method == "PUT") return HttpMethod::PUT;
  if (method == "DELETE") return HttpMethod::DELETE;
  if (method == "HEAD") return HttpMethod::HEAD;
  if (method == "OPTIONS") return HttpMethod::OPTIONS;
  if (method == "PATCH") return HttpMethod::PATCH;
  if (method == "CONNECT") return HttpMethod::CONNECT;
  if (method == "TRACE") return HttpMethod::TRACE;
  return HttpMethod::UNKNOWN;
}

const char* httpVersionToString(HttpVersion version) {
  switch (version) {
    case HttpVersion::HTTP_1_0: return "HTTP/1.0";
    case HttpVersion::HTTP_1_1: return "HTTP/1.1";
    default: return "HTTP/1.1";
  }
}

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

HttpHeaders::HttpHeaders(std::initializer_list<Entry> entries)
    : entries_(entries) {}

void HttpHeaders::add(const std::string& name, const std::string& value) {
  entries_.emplace_back(name, value);
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
  remove(name);
  add(name, value);
}

void HttpHeaders::remove(const std::string& name) {
  entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                [&name](const Entry& entry) {
                                  return equalsIgnoreCase(entry.first, name);
                                }),
                 entries_.end());
}

optional<std::string> HttpHeaders::get(const std::string& name) const {
  for (const auto& entry : entries_) {
    if (equalsIgnoreCase(entry.first, name)) {
      return entry.second;
    }
  }
  return nullopt;
}

std::vector<std::string> HttpHeaders::getAll(const std::string& name) const {
  std::vector<std::string> values;
  for (const auto& entry : entries_) {
    if (equalsIgnoreCase(entry.first, name)) {
      values.push_back(entry.second);
    }
  }
  return values;
}

bool HttpHeaders::has(const std::string& name) const {
  return get(name).has_value();
}

size_t HttpHeaders::byteSize() const {
  size_t size = 0;
  for (const auto& entry : entries_) {
    size += entry.first.size() + entry.second.size() + 4;  // ": " and "\r\n"
  }
  return size;
}

void HttpHeaders::forEach(
    std::function<void(const std::string&, const std::string&)> cb) const {
  for (const auto& entry : entries_) {
    cb(entry.first, entry.second);
  }
}

}  // namespace http
}  // namespace canal
