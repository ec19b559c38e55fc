#include "Stencil.h"
#include <cmath>
#include <map>
#include <memory>
#include <mutex>

torch::Tensor neighbor_offsets(int dim, int radius) {
    TORCH_CHECK(dim >= 1, "neighbor_offsets: dim must be >= 1, got ", dim);
    TORCH_CHECK(radius >= 0, "neighbor_offsets: radius must be >= 0, got ", radius);

    const int64_t base = 2 * radius + 1;
    int64_t count = 1;
    for (int a = 0; a < dim; ++a) count *= base;

    torch::Tensor steps = torch::empty({ count, dim }, torch::kInt64);
    auto acc = steps.accessor<int64_t, 2>();
    for (int64_t k = 0; k < count; ++k) {
        // 第 0 轴为最高位
        int64_t rem = k;
        for (int a = dim - 1; a >= 0; --a) {
            acc[k][a] = rem % base - radius;
            rem /= base;
        }
    }
    return steps;
}

const StencilTables& stencil_tables(int dim) {
    TORCH_CHECK(dim >= 1, "stencil_tables: dim must be >= 1, got ", dim);

    static std::mutex mutex;
    static std::map<int, std::unique_ptr<StencilTables>> cache;

    std::lock_guard<std::mutex> lock(mutex);
    auto it = cache.find(dim);
    if (it != cache.end()) return *it->second;

    auto tables = std::make_unique<StencilTables>();
    tables->dim = dim;
    tables->steps = neighbor_offsets(dim, 1);
    tables->center = tables->steps.size(0) / 2;
    tables->groups.assign(dim + 1, {});
    for (int f = 0; f <= dim; ++f) {
        tables->factors.push_back(std::sqrt(static_cast<double>(f)));
    }

    // 按 m-face 阶数 (非零分量个数) 分组
    auto acc = tables->steps.accessor<int64_t, 2>();
    for (int64_t k = 0; k < tables->steps.size(0); ++k) {
        int order = 0;
        for (int a = 0; a < dim; ++a) order += acc[k][a] != 0;
        tables->groups[order].push_back(k);
    }

    const StencilTables& ref = *tables;
    cache.emplace(dim, std::move(tables));
    return ref;
}
