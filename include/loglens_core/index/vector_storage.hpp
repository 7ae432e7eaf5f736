#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace loglens_core {

// Read-only random access to a row-major array of `size() x dimension()` floats.
class VectorStorage {
 public:
  virtual ~VectorStorage() = default;

  virtual size_t dimension() const = 0;
  virtual size_t size() const = 0;
  virtual const float *data() const = 0;

  const float *row(size_t position) const {
    return data() + position * dimension();
  }
};

class InMemoryVectorStorage : public VectorStorage {
 public:
  explicit InMemoryVectorStorage(size_t dimension) : dimension_(dimension) {}

  // Copies every row of another storage.
  static std::unique_ptr<InMemoryVectorStorage> copy_of(const VectorStorage &other);

  size_t dimension() const override {
    return dimension_;
  }
  size_t size() const override {
    return dimension_ == 0 ? 0 : data_.size() / dimension_;
  }
  const float *data() const override {
    return data_.data();
  }

  void append(const float *row);
  void reserve(size_t rows) {
    data_.reserve(rows * dimension_);
  }

 private:
  size_t dimension_;
  std::vector<float> data_;
};

// Header of vectors.bin. The payload starts at the next multiple of 64 bytes after the model id.
struct VectorFileHeader {
  static constexpr char kMagic[8] = {'L', 'L', 'V', 'I', 'D', 'X', '0', '1'};
  static constexpr uint32_t kVersion = 1;
  static constexpr size_t kPayloadAlignment = 64;

  uint32_t version = kVersion;
  uint32_t dimension = 0;
  uint64_t count = 0;
  std::string model_id;

  size_t payload_offset() const;
};

// vectors.bin mapped read-only with mmap(2). Pages are loaded on demand by the kernel.
class MappedVectorStorage : public VectorStorage {
 public:
  // Throws IndexFormatError on a missing, truncated or foreign file.
  static std::unique_ptr<MappedVectorStorage> open(const std::filesystem::path &path);
  ~MappedVectorStorage() override;

  MappedVectorStorage(const MappedVectorStorage &) = delete;
  MappedVectorStorage &operator=(const MappedVectorStorage &) = delete;

  size_t dimension() const override {
    return header_.dimension;
  }
  size_t size() const override {
    return static_cast<size_t>(header_.count);
  }
  const float *data() const override {
    return payload_;
  }

  const VectorFileHeader &header() const {
    return header_;
  }

 private:
  MappedVectorStorage() = default;

  const uint8_t *mapping_ = nullptr;
  size_t mapping_size_ = 0;
  const float *payload_ = nullptr;
  VectorFileHeader header_;
};

// Writes header and payload; the file is complete once this returns without throwing.
void write_vector_file(const std::filesystem::path &path, const std::string &model_id,
                       const VectorStorage &storage);

// Reads the whole file into memory. Throws IndexFormatError.
std::unique_ptr<InMemoryVectorStorage> read_vector_file(const std::filesystem::path &path,
                                                        VectorFileHeader *header_out = nullptr);

}  // namespace loglens_core
