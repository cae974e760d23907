#include "../include/vector_index.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstring>
#include <fstream>

static constexpr char kMagic[4] = {'M', 'R', 'V', 'I'};
static constexpr std::uint32_t kVersion = 1;
static constexpr std::size_t kHeaderBytes = 12;
static constexpr std::uint32_t kMaxLabelBytes = 4096;

template <typename T>
static void write_pod(std::ostream& os, const T& v) {
    os.write(reinterpret_cast<const char*>(&v), sizeof(T));
}

template <typename T>
static bool read_pod(std::istream& is, T& v) {
    return static_cast<bool>(is.read(reinterpret_cast<char*>(&v), sizeof(T)));
}

FlatVectorIndex::FlatVectorIndex(std::filesystem::path path, std::size_t dimension)
    : path_(std::move(path)), dim_(dimension) {
    if (dim_ == 0) throw std::invalid_argument("FlatVectorIndex: dimension must be > 0");
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec) || std::filesystem::file_size(path_, ec) == 0) {
        create();
    } else {
        load();
    }
}

void FlatVectorIndex::create() {
    if (path_.has_parent_path()) std::filesystem::create_directories(path_.parent_path());
    std::ofstream f(path_, std::ios::binary | std::ios::trunc);
    if (!f) throw StoreFailure("cannot create vector index: " + path_.string());
    f.write(kMagic, sizeof(kMagic));
    write_pod(f, kVersion);
    write_pod(f, (std::uint32_t)dim_);
    f.flush();
    if (!f) throw StoreFailure("cannot write vector index header: " + path_.string());
    end_offset_ = kHeaderBytes;
}

void FlatVectorIndex::load() {
    std::ifstream f(path_, std::ios::binary);
    if (!f) throw StoreFailure("cannot open vector index: " + path_.string());

    char magic[4];
    std::uint32_t version = 0, dim = 0;
    if (!f.read(magic, sizeof(magic)) || std::memcmp(magic, kMagic, sizeof(kMagic)) != 0 ||
        !read_pod(f, version) || !read_pod(f, dim)) {
        throw StoreFailure("not a vector index file: " + path_.string());
    }
    if (version != kVersion) {
        throw StoreFailure("unsupported vector index version " + std::to_string(version));
    }
    if (dim != dim_) throw DimensionMismatch(dim_, dim);

    std::uint64_t good_end = kHeaderBytes;
    std::vector<float> row(dim_);
    for (;;) {
        std::uint32_t len = 0;
        if (!read_pod(f, len)) break;
        if (len > kMaxLabelBytes) break;
        std::string label(len, '\0');
        if (len && !f.read(&label[0], len)) break;
        if (!f.read(reinterpret_cast<char*>(row.data()), (std::streamsize)(dim_ * sizeof(float)))) break;
        labels_.push_back(std::move(label));
        data_.insert(data_.end(), row.begin(), row.end());
        good_end += sizeof(std::uint32_t) + len + dim_ * sizeof(float);
    }
    f.close();

    auto on_disk = std::filesystem::file_size(path_);
    if (on_disk != good_end) {
        spdlog::warn("vector index {}: dropping {} bytes of partial entry after {} vectors",
                     path_.string(), on_disk - good_end, labels_.size());
        std::filesystem::resize_file(path_, good_end);
    }
    end_offset_ = good_end;
}

std::int64_t FlatVectorIndex::add(const std::string& label, const std::vector<float>& vec) {
    if (vec.size() != dim_) throw DimensionMismatch(dim_, vec.size());
    if (label.size() > kMaxLabelBytes) throw StoreFailure("index label too long: " + label.substr(0, 64));

    std::ofstream f(path_, std::ios::binary | std::ios::app);
    if (!f) throw StoreFailure("cannot append to vector index: " + path_.string());
    write_pod(f, (std::uint32_t)label.size());
    f.write(label.data(), (std::streamsize)label.size());
    f.write(reinterpret_cast<const char*>(vec.data()), (std::streamsize)(vec.size() * sizeof(float)));
    f.flush();
    if (!f) {
        f.close();
        std::error_code ec;
        std::filesystem::resize_file(path_, end_offset_, ec);
        throw StoreFailure("write to vector index failed: " + path_.string());
    }

    end_offset_ += sizeof(std::uint32_t) + label.size() + vec.size() * sizeof(float);
    labels_.push_back(label);
    data_.insert(data_.end(), vec.begin(), vec.end());
    return (std::int64_t)labels_.size();
}

std::vector<IndexHit> FlatVectorIndex::search(const std::vector<float>& query, int k) const {
    if (query.size() != dim_) throw DimensionMismatch(dim_, query.size());
    std::vector<IndexHit> out;
    if (k <= 0 || labels_.empty()) return out;

    out.reserve(labels_.size());
    std::vector<float> row(dim_);
    for (size_t i = 0; i < labels_.size(); ++i) {
        std::copy(data_.begin() + i * dim_, data_.begin() + (i + 1) * dim_, row.begin());
        out.push_back({(std::int64_t)i + 1, labels_[i], l2_squared(query, row)});
    }
    auto n = std::min<size_t>((size_t)k, out.size());
    std::partial_sort(out.begin(), out.begin() + n, out.end(), [](const IndexHit& a, const IndexHit& b) {
        if (a.distance != b.distance) return a.distance < b.distance;
        return a.handle < b.handle;
    });
    out.resize(n);
    return out;
}
