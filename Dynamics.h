#ifndef DYNAMICS_H
#define DYNAMICS_H

#include <opencv2/opencv.hpp>
#include <torch/torch.h>
#include <cstdint>
#include <tuple>
#include <vector>

// follow_flows 的返回结果
struct AdvectResult {
    torch::Tensor p;      // 最终位置 [D x Npts]，float32
    torch::Tensor inds;   // 起始像素整数坐标 [Npts x D]，int64，扫描顺序
    torch::Tensor trace;  // 轨迹 [niter+1 x D x Npts]，未请求时为空
};

/**
 * @brief 欧拉步长抑制因子，第 t 步的位移除以 (1+t)
 */
inline double step_factor(int64_t t) {
    return 1.0 + static_cast<double>(t);
}

/**
 * @brief 向量场散度，内部中心差分，边缘单侧差分
 * @param f [D x *shape]
 */
torch::Tensor divergence(const torch::Tensor& f);

/**
 * @brief 以归一化散度重新缩放流场: normalize_field(dP*mask) * normalize99(div)
 */
torch::Tensor div_rescale(const torch::Tensor& dP, const torch::Tensor& mask);

/**
 * @brief 插值动力学 (2D/3D)，grid_sample 双线性采样 + 动量平均
 * @param p 起始位置 [D x Npts]
 * @param dP 流场 [D x *shape]
 * @param niter 迭代次数
 * @param calc_trace 是否记录轨迹
 * @return (最终位置 [D x Npts], 轨迹或空)
 */
std::tuple<torch::Tensor, torch::Tensor> steps_interp(const torch::Tensor& p, const torch::Tensor& dP, int niter,
    torch::Device device = torch::kCPU, bool calc_trace = false);

/**
 * @brief 最近邻动力学 (任意维度)，在截断后的整数位置读取流场
 */
std::tuple<torch::Tensor, torch::Tensor> steps_nearest(const torch::Tensor& p, const torch::Tensor& dP, int niter,
    torch::Device device = torch::kCPU, bool calc_trace = false);

/**
 * @brief 通过迭代追踪像素点在流场中的运动轨迹
 * @param dP 流场 [D x *shape]
 * @param mask 前景掩膜，inds 为空时用于确定起点；两者都为空时取流场模长 > 1e-3 的像素
 * @param inds 起始像素 [Npts x D]
 * @param niter 迭代次数，全部执行，无提前收敛判断
 * @param interp 插值模式 (仅 2D/3D，其余维度退化为最近邻)
 */
AdvectResult follow_flows(const torch::Tensor& dP, const torch::Tensor& mask = {}, const torch::Tensor& inds = {},
    int niter = 200, bool interp = true, torch::Device device = torch::kCPU, bool calc_trace = false);

/**
 * @brief follow_flows 的 2D cv::Mat 封装
 * @param dP 流场，2 通道 CV_32F [Ly x Lx]，通道顺序为 (Y-flow, X-flow)
 * @param inds 初始像素点的整数坐标 (x, y)
 * @return (n_points, 1) CV_32FC2，每个点最终的浮点坐标 (y, x)
 */
cv::Mat follow_flows(const cv::Mat& dP, const std::vector<cv::Point>& inds, int niter = 200,
    torch::Device device = torch::kCPU);

#endif // DYNAMICS_H
