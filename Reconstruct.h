#ifndef RECONSTRUCT_H
#define RECONSTRUCT_H

#include <torch/torch.h>
#include <cstdint>
#include <tuple>

// -------------------------------------------------
// 收敛点云 -> 实例标签
// -------------------------------------------------

/**
 * @brief ND 连通域标记
 * @param mask ND 布尔掩膜
 * @param connectivity 邻接阶数 1..N，1 为面邻接，N 为全邻接 (含对角)
 * @return (int64 标签图，按扫描顺序编号 1..K; 连通域个数 K)
 */
std::tuple<torch::Tensor, int64_t> label_components(const torch::Tensor& mask, int connectivity);

/**
 * @brief 滞后阈值: 高于 low 的面连通区域中至少包含一个高于 high 的像素才保留
 * @return 布尔掩膜
 */
torch::Tensor hysteresis_threshold(const torch::Tensor& x, double low, double high);

/**
 * @brief 基于网格加速的 DBSCAN
 * @param points [Npts x D] 浮点坐标
 * @param eps 邻域半径 (距离 <= eps 视为邻居)
 * @param min_samples 核心点所需的邻居数 (含自身)
 * @return [Npts] int64，簇编号 0..C-1 (按首次出现顺序)，噪声为 -1
 */
torch::Tensor dbscan(const torch::Tensor& points, double eps, int64_t min_samples);

/**
 * @brief 噪声点吸附: 每个噪声点取其最近 k 个邻居中 (按距离排序) 第一个非噪声点的簇编号
 * @param points [Npts x D]
 * @param labels dbscan 输出，原地修改；无可用邻居时保持 -1
 * @param k 近邻数
 */
void snap_outliers(const torch::Tensor& points, torch::Tensor& labels, int k = 50);

/**
 * @brief 由像素收敛位置生成实例标签图
 * @param p 最终位置 [D x Npts]，与 inds 一一对应
 * @param bd 边界场，可为空
 * @param dist 距离场
 * @param mask 前景掩膜
 * @param inds 像素坐标 [Npts x D]
 * @param nclasses 网络输出类别数，>=4 时以距离场估计直径并使用较小的聚类半径；
 *                 仅 nclasses == 4 时用 bd 断开边缘粘连，否则忽略 bd 并对边缘骨架做开运算
 * @param cluster 强制 DBSCAN 聚类
 * @param diam_threshold 平均直径不超过此值时自动启用聚类
 * @return int64 标签图，inds 以外的像素为 0
 */
torch::Tensor get_masks(const torch::Tensor& p, const torch::Tensor& bd, const torch::Tensor& dist,
    const torch::Tensor& mask, const torch::Tensor& inds, int nclasses = 4, bool cluster = false,
    double diam_threshold = 12.0, bool verbose = false);

/**
 * @brief ND 最大池化 (步长 1，输出尺寸不变)
 * @param kernel_size 每个轴上的窗口宽度，奇数
 * @return float32
 */
torch::Tensor max_pool_nd(const torch::Tensor& input, int kernel_size = 5);

/**
 * @brief 去除像素数超过 max_size_fraction * numel 的实例并重编号
 */
torch::Tensor remove_large_masks_and_renumber(const torch::Tensor& labels, double max_size_fraction = 0.4);

/**
 * @brief 直方图种子法生成实例标签 (非 Eikonal 流程)
 * @param p 最终位置 [D x Npts]，与 inds 一一对应
 * @param inds 像素坐标 [Npts x D]
 * @param shape 输出尺寸
 * @param rpad 直方图网格每侧的扩展宽度，越界的点标为 0
 * @param max_size_fraction 超过此比例的实例视为错误合并并移除
 * @return int64 标签图，编号连续
 * @note 种子为 5^D 窗口内的局部极大且计数 > 10，每个种子沿计数 > 2 的格子扩展 5 步
 */
torch::Tensor get_masks_histogram(const torch::Tensor& p, const torch::Tensor& inds, at::IntArrayRef shape,
    int rpad = 20, double max_size_fraction = 0.4);

#endif // RECONSTRUCT_H
