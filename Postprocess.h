#ifndef POSTPROCESS_H
#define POSTPROCESS_H

#include <opencv2/opencv.hpp>
#include <torch/torch.h>

// -------------------------------------------------
// 标签图后处理: 填充孔洞、移除小实例、重编号
// -------------------------------------------------

/**
 * @brief 填充单个掩膜中的孔洞 (4 邻接的背景分量，不接触图像边缘即为孔洞)
 * @param mask_binary 单通道二值掩膜 (非 0 为前景)
 * @param max_hole_area 仅填充面积小于该值的孔洞，负数表示全部填充
 * @return CV_8U, 填充孔洞后的掩膜 (0/255)
 */
cv::Mat fill_holes_single_mask(const cv::Mat& mask_binary, double max_hole_area = -1.0);

/**
 * @brief 重编号为 1..K 并移除像素数小于 min_size 的实例
 * @param min_size <=0 时不移除
 * @return int64 标签图
 */
torch::Tensor remove_small_masks(const torch::Tensor& masks, int min_size = 15);

/**
 * @brief 填充空洞 去除小掩膜 (2D/3D)
 * @param masks 标签图
 * @param min_size 最小像素数，-1 关闭
 * @param hole_size 2D 下仅填充面积小于填满孔洞后实例面积 hole_size% 的孔洞
 * @param scale_factor hole_size 的缩放系数
 * @return int64 标签图，编号连续；3D 下逐层填充全部孔洞
 * @note 非 2D/3D 输入抛出 c10::Error
 */
torch::Tensor fill_holes_and_remove_small_masks(const torch::Tensor& masks, int min_size = 15, int hole_size = 3,
    double scale_factor = 1.0);

/**
 * @brief 2D cv::Mat 封装
 * @param masks_in 标签图 (CV_16U 或 CV_32S)
 * @return CV_32S 标签图
 */
cv::Mat fill_holes_and_remove_small_masks(const cv::Mat& masks_in, int min_size = 15, int hole_size = 3);

#endif // POSTPROCESS_H
