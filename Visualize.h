#ifndef VISUALIZE_H
#define VISUALIZE_H

#include <opencv2/opencv.hpp>
#include <torch/torch.h>

/**
 * @brief 将标签图转换为彩色分割图像。
 *
 * @param masks 输入标签图, 期望类型为 CV_32SC1 或 CV_16UC1。
 * 像素值为 0 为背景，>0 为实例ID。
 * @return cv::Mat 彩色分割图像，类型为 CV_8UC3。每个实例ID被赋予一个固定的随机颜色。
 */
cv::Mat masks_to_color_image(const cv::Mat& masks);

/**
 * @brief 流场的 HSV 可视化: 色相表示方向，亮度表示模长 (截断到 1)。
 *
 * @param dP 流场，2 通道 CV_32F，通道顺序为 (Y-flow, X-flow)。
 * @param scale 模长缩放，网络输出的 5 倍流场可传入 0.2。
 * @return cv::Mat CV_8UC3 图像，零向量为黑色。
 */
cv::Mat flow_to_color_image(const cv::Mat& dP, double scale = 1.0);

/**
 * @brief 在图像上绘制标签图的轮廓。
 *
 * @param original_img 背景图像 (CV_8UC3)。
 * @param masks 标签图 (CV_32SC1 或 CV_16UC1)。
 * @param color 轮廓的颜色，例如 cv::Scalar(0, 255, 0) 为绿色。
 * @param thickness 轮廓线的粗细。
 * @return cv::Mat 带有轮廓线的图像。
 */
cv::Mat draw_contours_on_image(const cv::Mat& original_img, const cv::Mat& masks,
    cv::Scalar color = cv::Scalar(0, 255, 0), int thickness = 1);

/**
 * @brief 绘制像素在流场中的运动轨迹 (2D)。
 *
 * @param original_img 背景图像 (CV_8UC3)。
 * @param trace follow_flows 记录的轨迹 [niter+1 x 2 x Npts]，坐标顺序 (y, x)。
 * @param stride 每隔 stride 个点绘制一条轨迹。
 * @param color 轨迹颜色，终点用同色实心圆标出。
 * @return cv::Mat 绘制后的图像。
 */
cv::Mat draw_trajectories(const cv::Mat& original_img, const torch::Tensor& trace, int stride = 10,
    cv::Scalar color = cv::Scalar(255, 255, 255));

#endif // VISUALIZE_H
