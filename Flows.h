#ifndef FLOWS_H
#define FLOWS_H

#include <torch/torch.h>
#include <cstdint>
#include "Cellflow_config.h"

// -------------------------------------------------
// 标签图 -> 势场 / 流场
// -------------------------------------------------

// masks_to_flows 的返回结果 (均在 CPU 上)
struct FlowResult {
    torch::Tensor labels;     // 稠密编号后的标签图，int64
    torch::Tensor dist;       // 距离场，float32
    torch::Tensor potential;  // 热扩散分布或平滑距离场，float64
    torch::Tensor flow;       // 流场 [D x *shape]，float32，单位长度或 0
};

/**
 * @brief 逐向量归一化，零向量及 NaN 模长保持为 0
 * @param mu [D x ...]
 */
torch::Tensor normalize_field(const torch::Tensor& mu);

/**
 * @brief 在前景像素上做松弛求解，得到势场与流场 (内层求解器)
 * @param labels ND 标签图
 * @param dists 距离场，Eikonal 模式下用于确定迭代次数，可为空
 * @param mode Heat: 每个实例中心点源扩散; Eikonal: 平滑距离场
 * @param device 计算设备
 * @param n_iter 迭代次数，<=0 时按模式自动确定
 */
FlowResult solve_fields(const torch::Tensor& labels, const torch::Tensor& dists,
    FlowMode mode = FlowMode::Eikonal, torch::Device device = torch::kCPU, int64_t n_iter = -1);

/**
 * @brief 标签图转流场 (外层): 计算距离场，Eikonal 模式下先按平均直径镜像填充以延长被截断细胞的骨架
 * @param labels ND 标签图
 * @param dists 预先计算的距离场，可为空
 * @param dim 3D 标签图且 dim == 2 时改用逐切片求解 (masks_to_flows_slices)
 * @note 单个实例铺满整幅图像时平均直径为无穷，此时不做镜像填充
 */
FlowResult masks_to_flows(const torch::Tensor& labels, const torch::Tensor& dists = {},
    FlowMode mode = FlowMode::Eikonal, torch::Device device = torch::kCPU, int dim = 0);

/**
 * @brief 3D 标签图的逐切片流场: 沿 z、y、x 三个方向分别求 2D 流场，累加到对应的两个分量上
 * @return flow [3 x Lz x Ly x Lx] 未归一化，每个分量由两个方向的切片贡献；potential 为 0
 */
FlowResult masks_to_flows_slices(const torch::Tensor& labels, const torch::Tensor& dists = {},
    FlowMode mode = FlowMode::Eikonal, torch::Device device = torch::kCPU);

/**
 * @brief 仅返回 Eikonal 平滑距离场
 */
torch::Tensor smooth_distance(const torch::Tensor& labels, const torch::Tensor& dists = {},
    torch::Device device = torch::kCPU);

#endif // FLOWS_H
