// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * io_npz.cpp
 *
 * Uncompressed (STORE) zip of .npy arrays, one per band, plus a JSON
 * metadata string holding the grid geometry and the band order.
 */

#include "floodfusion/io/npz.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace floodfusion {
namespace io {

namespace detail {

// ─── CRC32 ──────────────────────────────────────────────────────────────────

constexpr std::array<uint32_t, 256> buildCrc32Table() {
  std::array<uint32_t, 256> table{};
  for (uint32_t i = 0; i < 256; ++i) {
    uint32_t c = i;
    for (int j = 0; j < 8; ++j) {
      c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
    }
    table[i] = c;
  }
  return table;
}

static constexpr auto crc32Table = buildCrc32Table();

uint32_t crc32(const std::vector<char>& blob) {
  uint32_t crc = 0xFFFFFFFFu;
  for (char ch : blob) {
    crc = crc32Table[(crc ^ static_cast<uint8_t>(ch)) & 0xFF] ^ (crc >> 8);
  }
  return crc ^ 0xFFFFFFFFu;
}

// ─── Little-endian helpers ──────────────────────────────────────────────────

template <typename T>
void writeLE(std::ostream& os, T v) {
  for (size_t i = 0; i < sizeof(T); ++i) {
    os.put(static_cast<char>((static_cast<uint64_t>(v) >> (8 * i)) & 0xFF));
  }
}

template <typename T>
T readLE(std::istream& is) {
  uint8_t b[sizeof(T)] = {};
  is.read(reinterpret_cast<char*>(b), sizeof(T));
  uint64_t v = 0;
  for (size_t i = 0; i < sizeof(T); ++i) {
    v |= static_cast<uint64_t>(b[i]) << (8 * i);
  }
  return static_cast<T>(v);
}

// ─── ZIP STORE archive ──────────────────────────────────────────────────────

constexpr uint32_t kLocalHeaderSig = 0x04034b50;
constexpr uint32_t kCentralHeaderSig = 0x02014b50;
constexpr uint32_t kEndOfCentralDirSig = 0x06054b50;
constexpr uint16_t kZipVersion = 20;

/// Streams STORE entries to a file, then the central directory on finish().
class ZipWriter {
 public:
  explicit ZipWriter(std::ostream& os) : os_(os) {}

  void add(const std::string& name, const std::vector<char>& blob) {
    Entry e{name, crc32(blob), static_cast<uint32_t>(blob.size()),
            static_cast<uint32_t>(os_.tellp())};
    writeLE<uint32_t>(os_, kLocalHeaderSig);
    writeLE<uint16_t>(os_, kZipVersion);
    writeCommon(e);
    os_.write(e.name.data(), e.name.size());
    os_.write(blob.data(), blob.size());
    entries_.push_back(std::move(e));
  }

  void finish() {
    const auto cd_offset = static_cast<uint32_t>(os_.tellp());
    for (const auto& e : entries_) {
      writeLE<uint32_t>(os_, kCentralHeaderSig);
      writeLE<uint16_t>(os_, kZipVersion);  // made by
      writeLE<uint16_t>(os_, kZipVersion);  // needed
      writeCommon(e);
      writeLE<uint16_t>(os_, 0);  // comment length
      writeLE<uint16_t>(os_, 0);  // disk number
      writeLE<uint16_t>(os_, 0);  // internal attrs
      writeLE<uint32_t>(os_, 0);  // external attrs
      writeLE<uint32_t>(os_, e.offset);
      os_.write(e.name.data(), e.name.size());
    }
    const auto cd_size = static_cast<uint32_t>(os_.tellp()) - cd_offset;
    const auto count = static_cast<uint16_t>(entries_.size());

    writeLE<uint32_t>(os_, kEndOfCentralDirSig);
    writeLE<uint16_t>(os_, 0);  // disk number
    writeLE<uint16_t>(os_, 0);  // disk with central dir
    writeLE<uint16_t>(os_, count);
    writeLE<uint16_t>(os_, count);
    writeLE<uint32_t>(os_, cd_size);
    writeLE<uint32_t>(os_, cd_offset);
    writeLE<uint16_t>(os_, 0);  // comment length
  }

 private:
  struct Entry {
    std::string name;
    uint32_t crc;
    uint32_t size;
    uint32_t offset;
  };

  // Fields shared by local and central headers, from flags to extra length.
  void writeCommon(const Entry& e) {
    writeLE<uint16_t>(os_, 0);  // flags
    writeLE<uint16_t>(os_, 0);  // compression: STORE
    writeLE<uint16_t>(os_, 0);  // mod time
    writeLE<uint16_t>(os_, 0);  // mod date
    writeLE<uint32_t>(os_, e.crc);
    writeLE<uint32_t>(os_, e.size);  // compressed
    writeLE<uint32_t>(os_, e.size);  // uncompressed
    writeLE<uint16_t>(os_, static_cast<uint16_t>(e.name.size()));
    writeLE<uint16_t>(os_, 0);  // extra length
  }

  std::ostream& os_;
  std::vector<Entry> entries_;
};

struct StoredEntry {
  std::string name;
  std::vector<char> data;
};

/// Read local file headers sequentially. Returns false on a corrupt entry.
bool readStoredEntries(std::istream& is, std::vector<StoredEntry>& entries) {
  constexpr size_t kMaxEntries = 1000;
  constexpr uint32_t kMaxEntrySize = 400'000'000;  // 400MB

  while (entries.size() < kMaxEntries) {
    const auto sig = readLE<uint32_t>(is);
    if (is.fail() || sig != kLocalHeaderSig) break;

    // version(2), flags(2), compression(2), time(2), date(2), crc(4)
    is.ignore(14);
    readLE<uint32_t>(is);  // compressed size (== uncompressed for STORE)
    const auto size = readLE<uint32_t>(is);
    const auto name_len = readLE<uint16_t>(is);
    const auto extra_len = readLE<uint16_t>(is);
    if (is.fail()) return false;

    if (name_len > 4096 || size > kMaxEntrySize) {
      spdlog::error("[npz_io] Invalid entry (name_len={}, size={})", name_len,
                    size);
      return false;
    }

    StoredEntry entry;
    entry.name.resize(name_len);
    is.read(&entry.name[0], name_len);
    is.ignore(extra_len);
    entry.data.resize(size);
    is.read(entry.data.data(), size);
    if (is.fail()) {
      spdlog::error("[npz_io] Truncated data for entry '{}'", entry.name);
      return false;
    }
    entries.push_back(std::move(entry));
  }
  return true;
}

// ─── NumPy .npy format ──────────────────────────────────────────────────────

std::vector<char> buildNpy(const std::string& header_dict, const char* payload,
                           size_t payload_bytes) {
  // Magic(6) + version(2) + header_len(2), header padded to 64 bytes
  constexpr size_t kPrefixLen = 10;
  std::string dict = header_dict;
  size_t padding = 64 - ((kPrefixLen + dict.size() + 1) % 64);
  if (padding == 64) padding = 0;
  dict.append(padding, ' ');
  dict.push_back('\n');

  const auto header_len = static_cast<uint16_t>(dict.size());
  std::vector<char> buf;
  buf.reserve(kPrefixLen + header_len + payload_bytes);

  const char magic[] = {'\x93', 'N', 'U', 'M', 'P', 'Y', '\x01', '\x00'};
  buf.insert(buf.end(), magic, magic + 8);
  buf.push_back(static_cast<char>(header_len & 0xFF));
  buf.push_back(static_cast<char>((header_len >> 8) & 0xFF));
  buf.insert(buf.end(), dict.begin(), dict.end());
  buf.insert(buf.end(), payload, payload + payload_bytes);
  return buf;
}

std::vector<char> buildNpyArray(const grid_map::Matrix& matrix) {
  // Eigen::MatrixXf is column-major = Fortran order
  std::ostringstream dict;
  dict << "{'descr': '<f4', 'fortran_order': True, 'shape': ("
       << matrix.rows() << ", " << matrix.cols() << "), }";
  return buildNpy(dict.str(), reinterpret_cast<const char*>(matrix.data()),
                  static_cast<size_t>(matrix.size()) * sizeof(float));
}

std::vector<char> buildNpyString(const std::string& str) {
  std::ostringstream dict;
  dict << "{'descr': '|S" << str.size()
       << "', 'fortran_order': False, 'shape': (), }";
  return buildNpy(dict.str(), str.data(), str.size());
}

struct NpyInfo {
  int rows = 0;
  int cols = 0;
  bool is_float_array = false;  // '<f4' with shape (r, c)
  bool is_string = false;       // '|S...' with shape ()
  size_t string_len = 0;
  size_t data_offset = 0;
};

bool parseNpyHeader(const std::vector<char>& blob, NpyInfo& info) {
  if (blob.size() < 10 || std::memcmp(blob.data(), "\x93NUMPY", 6) != 0) {
    return false;
  }
  const uint16_t header_len =
      static_cast<uint8_t>(blob[8]) |
      (static_cast<uint16_t>(static_cast<uint8_t>(blob[9])) << 8);
  info.data_offset = 10 + header_len;
  if (info.data_offset > blob.size()) return false;

  const std::string dict(blob.data() + 10, header_len);
  try {
    if (dict.find("'<f4'") != std::string::npos) {
      const auto open = dict.find('(', dict.find("'shape'"));
      const auto close = dict.find(')', open);
      if (open == std::string::npos || close == std::string::npos) {
        return false;
      }
      const std::string shape = dict.substr(open + 1, close - open - 1);
      const auto comma = shape.find(',');
      if (comma == std::string::npos) return false;
      info.rows = std::stoi(shape.substr(0, comma));
      info.cols = std::stoi(shape.substr(comma + 1));
      info.is_float_array = true;
      return true;
    }
    const auto s_pos = dict.find("'|S");
    if (s_pos != std::string::npos) {
      const auto s_end = dict.find('\'', s_pos + 3);
      if (s_end == std::string::npos) return false;
      info.string_len = std::stoul(dict.substr(s_pos + 3, s_end - s_pos - 3));
      info.is_string = true;
      return true;
    }
  } catch (const std::exception&) {
    return false;
  }
  return false;
}

// ─── Metadata JSON ──────────────────────────────────────────────────────────

constexpr int kMetadataVersion = 1;

std::string escapeJson(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c == '"' || c == '\\') out += '\\';
    out += c;
  }
  return out;
}

std::string buildMetadataJson(const Raster& raster,
                              const std::vector<std::string>& bands) {
  const auto pos = raster.getPosition();
  const auto size = raster.getSize();
  const auto start = raster.getStartIndex();

  std::ostringstream json;
  json << std::setprecision(std::numeric_limits<double>::max_digits10);
  json << "{\"version\": " << kMetadataVersion
       << ", \"resolution\": " << raster.getResolution()
       << ", \"position\": [" << pos.x() << ", " << pos.y() << "]"
       << ", \"frame_id\": \"" << escapeJson(raster.getFrameId()) << "\""
       << ", \"size\": [" << size(0) << ", " << size(1) << "]"
       << ", \"start_index\": [" << start(0) << ", " << start(1) << "]"
       << ", \"bands\": [";
  for (size_t i = 0; i < bands.size(); ++i) {
    json << (i ? ", " : "") << "\"" << escapeJson(bands[i]) << "\"";
  }
  json << "]}";
  return json.str();
}

// Text after "key": in a flat JSON object.
bool jsonValue(const std::string& json, const std::string& key,
               std::string& out) {
  auto pos = json.find("\"" + key + "\"");
  if (pos == std::string::npos) return false;
  pos = json.find(':', pos);
  if (pos == std::string::npos) return false;
  out = json.substr(pos + 1);
  return true;
}

bool jsonDouble(const std::string& json, const std::string& key, double& out) {
  std::string rest;
  if (!jsonValue(json, key, rest)) return false;
  try {
    out = std::stod(rest);
  } catch (const std::exception&) {
    return false;
  }
  return true;
}

// Two numbers from "key": [a, b].
bool jsonPair(const std::string& json, const std::string& key, double& a,
              double& b) {
  std::string rest;
  if (!jsonValue(json, key, rest)) return false;
  const auto open = rest.find('[');
  const auto comma = rest.find(',', open);
  if (open == std::string::npos || comma == std::string::npos) return false;
  try {
    a = std::stod(rest.substr(open + 1));
    b = std::stod(rest.substr(comma + 1));
  } catch (const std::exception&) {
    return false;
  }
  return true;
}

// Quoted string starting at rest[from]; handles \" and \\ escapes.
bool readQuoted(const std::string& rest, size_t& from, std::string& out) {
  const auto q1 = rest.find('"', from);
  if (q1 == std::string::npos) return false;
  out.clear();
  for (size_t i = q1 + 1; i < rest.size(); ++i) {
    if (rest[i] == '\\' && i + 1 < rest.size()) {
      out += rest[++i];
    } else if (rest[i] == '"') {
      from = i + 1;
      return true;
    } else {
      out += rest[i];
    }
  }
  return false;
}

bool jsonString(const std::string& json, const std::string& key,
                std::string& out) {
  std::string rest;
  if (!jsonValue(json, key, rest)) return false;
  size_t from = 0;
  return readQuoted(rest, from, out);
}

bool jsonStringList(const std::string& json, const std::string& key,
                    std::vector<std::string>& out) {
  std::string rest;
  if (!jsonValue(json, key, rest)) return false;
  const auto open = rest.find('[');
  const auto close = rest.find(']', open);
  if (open == std::string::npos || close == std::string::npos) return false;
  const std::string inner = rest.substr(open + 1, close - open - 1);
  size_t from = 0;
  std::string item;
  while (readQuoted(inner, from, item)) out.push_back(item);
  return true;
}

}  // namespace detail

// ─── Save ───────────────────────────────────────────────────────────────────

bool saveNpz(const std::string& filename, const Raster& raster) {
  return saveNpz(filename, raster, raster.getLayers());
}

bool saveNpz(const std::string& filename, const Raster& raster,
             const std::vector<std::string>& band_names) {
  std::ofstream fs(filename, std::ios::binary);
  if (!fs.is_open()) {
    spdlog::error("[npz_io] Cannot create {}", filename);
    return false;
  }

  detail::ZipWriter zip(fs);
  std::vector<std::string> written;
  for (const auto& name : band_names) {
    if (!raster.exists(name)) {
      spdlog::warn("[npz_io] Band '{}' does not exist, skipping", name);
      continue;
    }
    zip.add(name + ".npy", detail::buildNpyArray(raster.get(name)));
    written.push_back(name);
  }
  zip.add("meta.npy",
          detail::buildNpyString(detail::buildMetadataJson(raster, written)));
  zip.finish();

  if (fs.fail()) {
    spdlog::error("[npz_io] Write failed for {}", filename);
    return false;
  }
  return true;
}

// ─── Load ───────────────────────────────────────────────────────────────────

bool loadNpz(const std::string& filename, Raster& raster) {
  std::ifstream fs(filename, std::ios::binary);
  if (!fs.is_open()) {
    spdlog::error("[npz_io] Cannot open {}", filename);
    return false;
  }

  std::vector<detail::StoredEntry> entries;
  if (!detail::readStoredEntries(fs, entries)) return false;
  if (entries.empty()) {
    spdlog::error("[npz_io] No entries found in {}", filename);
    return false;
  }

  std::string metadata_json;
  for (const auto& e : entries) {
    if (e.name != "meta.npy") continue;
    detail::NpyInfo info;
    if (!detail::parseNpyHeader(e.data, info) || !info.is_string ||
        info.data_offset + info.string_len > e.data.size()) {
      spdlog::error("[npz_io] Invalid meta.npy in {}", filename);
      return false;
    }
    metadata_json.assign(e.data.data() + info.data_offset, info.string_len);
  }
  if (metadata_json.empty()) {
    spdlog::error("[npz_io] No meta.npy entry in {}", filename);
    return false;
  }

  double version = 0;
  if (detail::jsonDouble(metadata_json, "version", version) &&
      static_cast<int>(version) > detail::kMetadataVersion) {
    spdlog::error("[npz_io] Unsupported metadata version {} (max {})",
                  static_cast<int>(version), detail::kMetadataVersion);
    return false;
  }

  double resolution = 0, pos_x = 0, pos_y = 0;
  double size_rows = 0, size_cols = 0, start_x = 0, start_y = 0;
  std::string frame_id;
  if (!detail::jsonDouble(metadata_json, "resolution", resolution) ||
      !detail::jsonPair(metadata_json, "position", pos_x, pos_y) ||
      !detail::jsonPair(metadata_json, "size", size_rows, size_cols)) {
    spdlog::error("[npz_io] Incomplete metadata in {}", filename);
    return false;
  }
  detail::jsonString(metadata_json, "frame_id", frame_id);
  detail::jsonPair(metadata_json, "start_index", start_x, start_y);

  const int rows = static_cast<int>(size_rows);
  const int cols = static_cast<int>(size_cols);
  if (rows <= 0 || cols <= 0 || resolution <= 0) {
    spdlog::error("[npz_io] Invalid raster dimensions ({}x{}, res={})", rows,
                  cols, resolution);
    return false;
  }

  // Circular buffer start must lie inside the grid
  if (!(start_x >= 0 && start_x < rows && start_y >= 0 && start_y < cols) ||
      start_x != std::floor(start_x) || start_y != std::floor(start_y)) {
    spdlog::error("[npz_io] Invalid start index ({}, {}) for a {}x{} raster",
                  start_x, start_y, rows, cols);
    return false;
  }

  // Band order from metadata, else archive order
  std::vector<std::string> order;
  detail::jsonStringList(metadata_json, "bands", order);
  if (order.empty()) {
    for (const auto& e : entries) {
      if (e.name != "meta.npy" && e.name.size() > 4 &&
          e.name.compare(e.name.size() - 4, 4, ".npy") == 0) {
        order.push_back(e.name.substr(0, e.name.size() - 4));
      }
    }
  }

  Raster loaded;
  loaded.setGeometry(static_cast<float>(resolution * rows),
                     static_cast<float>(resolution * cols),
                     static_cast<float>(resolution),
                     grid_map::Position(pos_x, pos_y));
  loaded.setFrameId(frame_id);
  loaded.setStartIndex(grid_map::Index(static_cast<int>(start_x),
                                       static_cast<int>(start_y)));

  const size_t expected_bytes = static_cast<size_t>(rows) * cols * sizeof(float);
  for (const auto& band_name : order) {
    const auto it = std::find_if(
        entries.begin(), entries.end(),
        [&](const detail::StoredEntry& e) { return e.name == band_name + ".npy"; });
    if (it == entries.end()) {
      spdlog::warn("[npz_io] Band '{}' listed but not stored", band_name);
      continue;
    }
    detail::NpyInfo info;
    if (!detail::parseNpyHeader(it->data, info) || !info.is_float_array) {
      spdlog::warn("[npz_io] Skipping non-float entry '{}'", it->name);
      continue;
    }
    if (info.rows != rows || info.cols != cols ||
        info.data_offset + expected_bytes > it->data.size()) {
      spdlog::warn("[npz_io] Shape mismatch or truncation for '{}'", band_name);
      continue;
    }
    loaded.add(band_name);
    std::memcpy(loaded.get(band_name).data(),
                it->data.data() + info.data_offset, expected_bytes);
  }

  if (loaded.bandCount() == 0) {
    spdlog::error("[npz_io] No band data found in {}", filename);
    return false;
  }
  raster = std::move(loaded);
  return true;
}

}  // namespace io
}  // namespace floodfusion
