#ifndef CELLFLOW_CORE_H
#define CELLFLOW_CORE_H

#include <opencv2/opencv.hpp>
#include <torch/torch.h>
#include "Cellflow_config.h"

// -------------------------------------------------
// 输出定义
// -------------------------------------------------

// compute_masks 的返回结果
struct MaskResult {
    torch::Tensor masks;  // int64 实例标签图，编号连续
    torch::Tensor p;      // 像素最终位置 [D x Npts]，无前景时为 [D x 0]
    torch::Tensor trace;  // 轨迹 [niter+1 x D x Npts]，未请求时为空
};

// -------------------------------------------------
// 函数声明
// -------------------------------------------------

/**
 * @brief 掩码计算函数: 前景阈值 -> 流场预处理 -> 动力学 -> 重建 -> 一致性过滤 -> 后处理
 * @param dP 网络输出的流场 [D x *shape]
 * @param dist 网络输出的距离场 [*shape]
 * @param bd 网络输出的边界场，可为空；仅在 omni 且 nclasses == 4 时参与边缘骨架的断开
 * @param p 预先计算的像素最终位置 [D x Npts] (与前景像素扫描顺序对应)，为空时运行动力学
 * @param inds 起始像素 [Npts x D]，可为空
 * @param params 阈值与开关
 * @param caps 运行设备
 * @return MaskResult
 */
MaskResult compute_masks(const torch::Tensor& dP, const torch::Tensor& dist, const torch::Tensor& bd = {},
    const torch::Tensor& p = {}, const torch::Tensor& inds = {}, const MaskParams& params = MaskParams(),
    const Capabilities& caps = Capabilities());

/**
 * @brief compute_masks 的 2D cv::Mat 封装
 * @param dP 流场 CV_32FC2 [Ly x Lx]，通道顺序为 (Y-flow, X-flow)
 * @param dist 距离场 CV_32F [Ly x Lx]
 * @param bd 边界场 CV_32F，可为空
 * @return 实例分割掩码图，CV_32S 类型
 */
cv::Mat compute_masks(const cv::Mat& dP, const cv::Mat& dist, const cv::Mat& bd,
    const MaskParams& params = MaskParams(), const Capabilities& caps = Capabilities());

/**
 * @brief 标签图转训练用流场
 * @param labels ND 标签图
 * @param dim 3D 标签图传 2 时逐切片计算流场
 * @return float32 [D+3 x *shape]: 标签、距离场、D 个流场分量、势场
 */
torch::Tensor labels_to_flows(const torch::Tensor& labels, FlowMode mode = FlowMode::Eikonal,
    torch::Device device = torch::kCPU, int dim = 0);

/**
 * @brief 网络训练目标
 * @param labels ND 标签图，至少包含一个前景像素
 * @param dist_bg 背景处平滑距离场取 -dist_bg
 * @return float32 [5+D x *shape]: 标签、前景、边界 (edt==1)、平滑距离场、权重、5 倍流场
 */
torch::Tensor training_target(const torch::Tensor& labels, double dist_bg = 5.0,
    torch::Device device = torch::kCPU);

#endif // CELLFLOW_CORE_H
