#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

struct IndexHit {
    std::int64_t handle{0}; // 1-based position in add order
    std::string label;      // source_id the vector was added under
    float distance{0.0f};   // squared L2
};

// Exact (linear scan) L2 index persisted as an append-only file:
//   header  : "MRVI" | u32 version | u32 dimension
//   entries : u32 label_len | label bytes | dimension x f32
// Every entry carries its label so a hit never depends on row order elsewhere.
class FlatVectorIndex {
public:
    FlatVectorIndex(std::filesystem::path path, std::size_t dimension);

    std::int64_t add(const std::string& label, const std::vector<float>& vec);
    std::vector<IndexHit> search(const std::vector<float>& query, int k) const;

    std::size_t size() const { return labels_.size(); }
    std::size_t dimension() const { return dim_; }
    const std::vector<std::string>& labels() const { return labels_; }
    const std::filesystem::path& path() const { return path_; }

private:
    void create();
    void load();

    std::filesystem::path path_;
    std::size_t dim_ {0};
    std::uint64_t end_offset_ {0}; // bytes of whole entries on disk
    std::vector<std::string> labels_;
    std::vector<float> data_; // size() * dim_ floats, row-major
};
