#ifndef DISTANCE_H
#define DISTANCE_H

#include <torch/torch.h>
#include <cstdint>

// -------------------------------------------------
// 距离变换与尺度估计
// -------------------------------------------------

/**
 * @brief 多标签欧氏距离变换 (可分离抛物线下包络)
 * @param labels ND 整数标签图，0 为背景
 * @param black_border 为 true 时图像外部视为背景
 * @return float32 距离场，每个前景像素到最近的不同标签像素 (含背景) 的距离，背景为 0
 */
torch::Tensor edt(const torch::Tensor& labels, bool black_border = false);

/**
 * @brief 由正距离值估计平均直径 2*(n+1)*mean(dt_pos)
 * @param dt_pos 前景像素的距离值 (非空)
 * @param n 空间维度
 */
double dist_to_diam(const torch::Tensor& dt_pos, int64_t n);

/**
 * @brief 标签图中实例的平均直径
 * @param dist_threshold 仅统计距离大于该值的像素
 * @note 没有前景像素时抛出 c10::Error
 */
double diameters(const torch::Tensor& labels, double dist_threshold = 0.0);

/**
 * @brief Eikonal 松弛迭代次数上界 ceil(max(dists)*1.16)+1
 * @note 1.16 是在一系列超椭圆上标定的经验系数，不是严格证明
 */
int64_t get_niter(const torch::Tensor& dists);

#endif // DISTANCE_H
