#include "wtmirror/fs.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <vector>

namespace wtmirror::fs {

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

void ensure_parent_dir(const std::filesystem::path &p) {
  std::error_code ec;
  std::filesystem::create_directories(p.parent_path(), ec);
  if (ec)
    throw std::runtime_error("mkdir -p failed: " + p.parent_path().string() + ": " + ec.message());
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  ifs.seekg(0, std::ios::end);
  auto n = static_cast<std::size_t>(ifs.tellg());
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  if (!ifs)
    throw std::runtime_error("read failed: " + p.string());
  return buf;
}

std::string to_posix(std::string_view path) {
  std::vector<std::string_view> parts;
  std::size_t start = 0;
  while (start <= path.size()) {
    std::size_t end = path.find_first_of("/\\", start);
    if (end == std::string_view::npos)
      end = path.size();
    const auto seg = path.substr(start, end - start);
    if (seg == "..") {
      if (!parts.empty() && parts.back() != "..")
        parts.pop_back();
      else
        parts.push_back(seg);
    } else if (!seg.empty() && seg != ".") {
      parts.push_back(seg);
    }
    start = end + 1;
  }

  std::string out;
  for (const auto &seg : parts) {
    if (!out.empty())
      out.push_back('/');
    out.append(seg);
  }
  return out;
}

std::string relative_generic(const std::filesystem::path &p, const std::filesystem::path &root) {
  auto rel = p.lexically_relative(root).generic_string();
  return rel.empty() ? std::string(".") : rel;
}

bool is_within(const std::filesystem::path &p, const std::filesystem::path &base) {
  auto pit = p.begin();
  for (auto bit = base.begin(); bit != base.end(); ++bit, ++pit) {
    // a trailing separator on base yields an empty final element
    if (bit->empty() && std::next(bit) == base.end())
      return true;
    if (pit == p.end() || *pit != *bit)
      return false;
  }
  return true;
}

bool same_location(const std::filesystem::path &a, const std::filesystem::path &b) {
  std::error_code ec;
  const bool eq = std::filesystem::equivalent(a, b, ec);
  if (!ec)
    return eq;
  const auto ra = std::filesystem::weakly_canonical(a, ec);
  if (ec)
    return a.lexically_normal() == b.lexically_normal();
  const auto rb = std::filesystem::weakly_canonical(b, ec);
  if (ec)
    return a.lexically_normal() == b.lexically_normal();
  return ra == rb;
}

} // namespace wtmirror::fs
