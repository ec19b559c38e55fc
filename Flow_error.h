#ifndef FLOW_ERROR_H
#define FLOW_ERROR_H

#include <torch/torch.h>
#include "Cellflow_config.h"

// -------------------------------------------------
// 流场一致性检验
// -------------------------------------------------

// flow_error 的返回结果
struct FlowErrorResult {
    torch::Tensor errors;    // [K] float32，每个实例的均方误差
    torch::Tensor dP_masks;  // 由标签重新计算的流场 [D x *shape]
};

/**
 * @brief 由候选标签重新求解流场，并与网络流场比较
 * @param masks 候选标签图
 * @param dP_net 网络输出的流场 [D x *shape]，按 5 倍尺度训练，比较前除以 5
 * @return 每个实例上 sum_axes((dP_masks - dP_net/5)^2) 的均值
 * @note dP_net 的空间形状与 masks 不一致时抛出 c10::Error
 */
FlowErrorResult flow_error(const torch::Tensor& masks, const torch::Tensor& dP_net,
    FlowMode mode = FlowMode::Eikonal, torch::Device device = torch::kCPU);

/**
 * @brief 移除流场误差大于 threshold 的实例并重编号
 */
torch::Tensor remove_bad_flow_masks(const torch::Tensor& masks, const torch::Tensor& flows, float threshold = 0.4f,
    FlowMode mode = FlowMode::Eikonal, torch::Device device = torch::kCPU);

#endif // FLOW_ERROR_H
