#ifndef TENSOR_UTILS_H
#define TENSOR_UTILS_H

#include <opencv2/opencv.hpp>
#include <torch/torch.h>
#include <cstdint>
#include <vector>

// -------------------------------------------------
// ND 数组工具: OpenCV <-> LibTorch 转换、填充、重编号、形态学
// -------------------------------------------------

/**
 * @brief cv::Mat 转 Tensor
 * @param mat 2D 矩阵，单通道输出 [H x W]，多通道输出 [C x H x W]
 * @return 拷贝后的 Tensor (CV_16U 转为 int32)
 */
torch::Tensor mat_to_tensor(const cv::Mat& mat);

/**
 * @brief Tensor 转 cv::Mat
 * @param t [H x W] 或 [C x H x W]，int64/int32 -> CV_32S, float -> CV_32F, double -> CV_64F, bool/uint8 -> CV_8U
 */
cv::Mat tensor_to_mat(const torch::Tensor& t);

/**
 * @brief C 顺序 (行优先) 展平步长
 */
std::vector<int64_t> c_strides(at::IntArrayRef shape);

/**
 * @brief 对最后 ndim 个维度做常数 0 填充
 */
torch::Tensor pad_zero(const torch::Tensor& t, int64_t pad, int64_t ndim);

/**
 * @brief 对最后 ndim 个维度做镜像填充 (不重复边缘像素)，pad 可以大于维度长度
 */
torch::Tensor pad_reflect(const torch::Tensor& t, int64_t pad, int64_t ndim);

/**
 * @brief 去除最后 ndim 个维度两侧各 pad 个像素
 */
torch::Tensor unpad(const torch::Tensor& t, int64_t pad, int64_t ndim);

/**
 * @brief 标签重编号为 1..K，背景保持 0
 * @return int64 标签图
 */
torch::Tensor renumber(const torch::Tensor& labels);

/**
 * @brief 以 1% 与 99% 分位数归一化
 */
torch::Tensor normalize99(const torch::Tensor& x);

/**
 * @brief 十字结构元的二值膨胀
 * @param border_value 图像外部视为的值
 */
torch::Tensor binary_dilation(const torch::Tensor& mask, int iterations = 1, bool border_value = false);

/**
 * @brief 十字结构元的二值腐蚀
 */
torch::Tensor binary_erosion(const torch::Tensor& mask, int iterations = 1, bool border_value = false);

/**
 * @brief 二值开运算 (先腐蚀后膨胀)
 */
torch::Tensor binary_opening(const torch::Tensor& mask, int iterations = 1);

/**
 * @brief 距离图像边缘不超过 width 个像素的框形掩膜
 */
torch::Tensor border_frame(at::IntArrayRef shape, int64_t width);

/**
 * @brief ND 最近邻缩放 (端点对齐)
 */
torch::Tensor resize_nearest(const torch::Tensor& labels, const std::vector<int64_t>& shape);

/**
 * @brief ND 可分离高斯滤波，边界采用最近像素延拓
 */
torch::Tensor gaussian_filter(const torch::Tensor& x, double sigma);

#endif // TENSOR_UTILS_H
