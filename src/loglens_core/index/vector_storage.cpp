#include "loglens_core/index/vector_storage.hpp"

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

#include "loglens_core/types/errors.hpp"

namespace loglens_core {

namespace {

constexpr size_t kFixedHeaderSize = 8 + 4 + 4 + 8 + 4;

template <typename T>
T read_scalar(const uint8_t *data, size_t offset) {
  T value;
  std::memcpy(&value, data + offset, sizeof(T));
  return value;
}

// Validates the header and that the file holds the whole payload.
VectorFileHeader parse_header(const uint8_t *data, size_t size, const std::filesystem::path &path) {
  if (size < kFixedHeaderSize ||
      std::memcmp(data, VectorFileHeader::kMagic, sizeof(VectorFileHeader::kMagic)) != 0) {
    throw IndexFormatError("Not a vector index file: " + path.string());
  }

  VectorFileHeader header;
  header.version = read_scalar<uint32_t>(data, 8);
  header.dimension = read_scalar<uint32_t>(data, 12);
  header.count = read_scalar<uint64_t>(data, 16);
  const uint32_t model_id_length = read_scalar<uint32_t>(data, 24);

  if (header.version != VectorFileHeader::kVersion) {
    throw IndexFormatError("Unsupported vector file version " + std::to_string(header.version) +
                           " in " + path.string());
  }
  if (kFixedHeaderSize + model_id_length > size) {
    throw IndexFormatError("Truncated vector file header: " + path.string());
  }
  header.model_id.assign(reinterpret_cast<const char *>(data + kFixedHeaderSize), model_id_length);

  if (header.dimension == 0 && header.count > 0) {
    throw IndexFormatError("Vector file declares zero dimension: " + path.string());
  }
  // Compared by division: count * dimension can overflow for a damaged header.
  const size_t offset = header.payload_offset();
  const size_t row_bytes = static_cast<size_t>(header.dimension) * sizeof(float);
  if (offset > size || (row_bytes > 0 && header.count > (size - offset) / row_bytes)) {
    throw IndexFormatError("Truncated vector payload in " + path.string() + ": expected " +
                           std::to_string(header.count) + " vectors");
  }
  return header;
}

}  // namespace

size_t VectorFileHeader::payload_offset() const {
  const size_t unaligned = kFixedHeaderSize + model_id.size();
  return (unaligned + kPayloadAlignment - 1) / kPayloadAlignment * kPayloadAlignment;
}

std::unique_ptr<InMemoryVectorStorage> InMemoryVectorStorage::copy_of(const VectorStorage &other) {
  auto copy = std::make_unique<InMemoryVectorStorage>(other.dimension());
  copy->data_.assign(other.data(), other.data() + other.size() * other.dimension());
  return copy;
}

void InMemoryVectorStorage::append(const float *row) {
  data_.insert(data_.end(), row, row + dimension_);
}

std::unique_ptr<MappedVectorStorage> MappedVectorStorage::open(const std::filesystem::path &path) {
  int fd = ::open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    throw IndexFormatError("Cannot open vector file " + path.string() + ": " +
                           std::strerror(errno));
  }

  struct stat st;
  if (fstat(fd, &st) < 0) {
    int saved = errno;
    close(fd);
    throw IndexFormatError("Cannot stat vector file " + path.string() + ": " +
                           std::strerror(saved));
  }

  std::unique_ptr<MappedVectorStorage> storage(new MappedVectorStorage());
  storage->mapping_size_ = static_cast<size_t>(st.st_size);
  if (storage->mapping_size_ == 0) {
    close(fd);
    throw IndexFormatError("Empty vector file: " + path.string());
  }

  void *mapped = mmap(nullptr, storage->mapping_size_, PROT_READ, MAP_PRIVATE, fd, 0);
  // The mapping keeps its own reference to the file.
  close(fd);
  if (mapped == MAP_FAILED) {
    throw IndexFormatError("mmap failed for " + path.string() + ": " + std::strerror(errno));
  }
  storage->mapping_ = static_cast<const uint8_t *>(mapped);

  storage->header_ = parse_header(storage->mapping_, storage->mapping_size_, path);
  storage->payload_ =
      reinterpret_cast<const float *>(storage->mapping_ + storage->header_.payload_offset());
  return storage;
}

MappedVectorStorage::~MappedVectorStorage() {
  if (mapping_) {
    munmap(const_cast<uint8_t *>(mapping_), mapping_size_);
  }
}

void write_vector_file(const std::filesystem::path &path, const std::string &model_id,
                       const VectorStorage &storage) {
  VectorFileHeader header;
  header.dimension = static_cast<uint32_t>(storage.dimension());
  header.count = storage.size();
  header.model_id = model_id;

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    throw IndexFormatError("Cannot write vector file " + path.string());
  }

  const uint32_t model_id_length = static_cast<uint32_t>(model_id.size());
  out.write(VectorFileHeader::kMagic, sizeof(VectorFileHeader::kMagic));
  out.write(reinterpret_cast<const char *>(&header.version), sizeof(header.version));
  out.write(reinterpret_cast<const char *>(&header.dimension), sizeof(header.dimension));
  out.write(reinterpret_cast<const char *>(&header.count), sizeof(header.count));
  out.write(reinterpret_cast<const char *>(&model_id_length), sizeof(model_id_length));
  out.write(model_id.data(), static_cast<std::streamsize>(model_id.size()));

  const size_t padding = header.payload_offset() - kFixedHeaderSize - model_id.size();
  const std::string zeros(padding, '\0');
  out.write(zeros.data(), static_cast<std::streamsize>(zeros.size()));

  out.write(reinterpret_cast<const char *>(storage.data()),
            static_cast<std::streamsize>(storage.size() * storage.dimension() * sizeof(float)));
  out.flush();
  if (!out) {
    throw IndexFormatError("Failed writing vector file " + path.string());
  }
}

std::unique_ptr<InMemoryVectorStorage> read_vector_file(const std::filesystem::path &path,
                                                        VectorFileHeader *header_out) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw IndexFormatError("Cannot open vector file " + path.string());
  }
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

  VectorFileHeader header = parse_header(bytes.data(), bytes.size(), path);
  auto storage = std::make_unique<InMemoryVectorStorage>(header.dimension);
  storage->reserve(static_cast<size_t>(header.count));
  const float *payload = reinterpret_cast<const float *>(bytes.data() + header.payload_offset());
  for (uint64_t i = 0; i < header.count; ++i) {
    storage->append(payload + i * header.dimension);
  }
  if (header_out) {
    *header_out = std::move(header);
  }
  return storage;
}

}  // namespace loglens_core
