#ifndef STENCIL_H
#define STENCIL_H

#include <torch/torch.h>
#include <cstdint>
#include <vector>

// -------------------------------------------------
// N 维 3^N 邻域模板
// -------------------------------------------------

// 按维度缓存的只读模板表
struct StencilTables {
    int dim = 0;
    torch::Tensor steps;                        // [3^N x N] int64，取值 {-1,0,1}，笛卡尔积顺序
    std::vector<std::vector<int64_t>> groups;   // groups[f]: 非零分量个数为 f 的偏移下标 (升序)
    std::vector<double> factors;                // factors[f] = sqrt(f)
    int64_t center = 0;                         // 中心偏移下标 3^N / 2
};

/**
 * @brief 获取 dim 维模板表 (线程安全，按维度缓存)
 * @note 下标 k 与 3^N-1-k 互为对称偏移
 */
const StencilTables& stencil_tables(int dim);

/**
 * @brief [-radius, radius]^dim 内全部偏移，笛卡尔积顺序
 * @return [(2r+1)^dim x dim] int64
 */
torch::Tensor neighbor_offsets(int dim, int radius);

#endif // STENCIL_H
