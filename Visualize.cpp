#include "Visualize.h"
#include <c10/util/Logging.h>
#include <map>
#include <random>
#include <set>

/**
 * @brief 内部函数：为给定的实例ID生成一个随机但区分度高的颜色。
 * 使用HSV颜色空间生成颜色，保证较高的亮度和饱和度，背景颜色为黑色。
 */
static cv::Scalar get_random_color(int label) {
    if (label == 0) {
        return cv::Scalar(0, 0, 0);
    }

    // 以实例ID为种子，保证每次运行颜色一致
    std::mt19937 gen(label);
    std::uniform_int_distribution<> distrib_h(0, 179); // OpenCV HUE 范围 0-179

    int h = distrib_h(gen);
    int s = 200 + (label % 55);
    int v = 200 + (label % 55);

    cv::Mat hsv(1, 1, CV_8UC3, cv::Scalar(h, s, v));
    cv::Mat bgr;
    cv::cvtColor(hsv, bgr, cv::COLOR_HSV2BGR);

    cv::Vec3b color = bgr.at<cv::Vec3b>(0, 0);
    return cv::Scalar(color[0], color[1], color[2]);
}

// 读取 CV_32S / CV_16U 标签
static int label_at(const cv::Mat& masks, int y, int x) {
    return masks.type() == CV_32SC1 ? masks.at<int>(y, x) : masks.at<unsigned short>(y, x);
}

cv::Mat masks_to_color_image(const cv::Mat& masks) {
    if (masks.empty()) {
        return cv::Mat();
    }

    if (masks.type() != CV_32SC1 && masks.type() != CV_16UC1) {
        LOG(ERROR) << "masks_to_color_image: masks must be CV_32SC1 or CV_16UC1";
        return cv::Mat();
    }

    cv::Mat color_image(masks.size(), CV_8UC3, cv::Scalar(0, 0, 0));
    std::map<int, cv::Scalar> color_map;

    for (int y = 0; y < masks.rows; ++y) {
        cv::Vec3b* color_ptr = color_image.ptr<cv::Vec3b>(y);
        for (int x = 0; x < masks.cols; ++x) {
            int label = label_at(masks, y, x);
            if (label <= 0) continue;

            if (color_map.find(label) == color_map.end()) {
                color_map[label] = get_random_color(label);
            }
            const cv::Scalar& color = color_map[label];
            color_ptr[x][0] = (uchar)color[0]; // B
            color_ptr[x][1] = (uchar)color[1]; // G
            color_ptr[x][2] = (uchar)color[2]; // R
        }
    }

    return color_image;
}

cv::Mat flow_to_color_image(const cv::Mat& dP, double scale) {
    if (dP.empty()) {
        return cv::Mat();
    }
    if (dP.channels() != 2) {
        LOG(ERROR) << "flow_to_color_image: dP must have 2 channels (Y-flow, X-flow)";
        return cv::Mat();
    }

    std::vector<cv::Mat> ch;
    cv::split(dP, ch);
    cv::Mat fy, fx;
    ch[0].convertTo(fy, CV_32F, scale);
    ch[1].convertTo(fx, CV_32F, scale);

    // 1. 极坐标: 角度 [0, 360) -> 色相 [0, 180)
    cv::Mat mag, angle;
    cv::cartToPolar(fx, fy, mag, angle, true);
    cv::min(mag, 1.0, mag);

    cv::Mat hue, value;
    angle.convertTo(hue, CV_8U, 0.5);
    mag.convertTo(value, CV_8U, 255.0);
    cv::Mat saturation(dP.size(), CV_8U, cv::Scalar(255));

    // 2. HSV -> BGR
    cv::Mat hsv, bgr;
    cv::merge(std::vector<cv::Mat>{ hue, saturation, value }, hsv);
    cv::cvtColor(hsv, bgr, cv::COLOR_HSV2BGR);
    return bgr;
}

cv::Mat draw_contours_on_image(const cv::Mat& original_img, const cv::Mat& masks,
    cv::Scalar color, int thickness) {
    if (original_img.empty() || masks.empty()) {
        return cv::Mat();
    }

    cv::Mat result = original_img.clone();

    // 1. 获取所有实例ID
    std::set<int> unique_labels;
    for (int y = 0; y < masks.rows; ++y) {
        for (int x = 0; x < masks.cols; ++x) {
            int label = label_at(masks, y, x);
            if (label > 0) unique_labels.insert(label);
        }
    }

    // 2. 逐个实例提取轮廓并绘制
    for (int label : unique_labels) {
        cv::Mat current_mask = (masks == label);
        std::vector<std::vector<cv::Point>> contours;
        cv::findContours(current_mask, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
        cv::drawContours(result, contours, -1, color, thickness);
    }

    return result;
}

cv::Mat draw_trajectories(const cv::Mat& original_img, const torch::Tensor& trace, int stride,
    cv::Scalar color) {
    if (original_img.empty() || !trace.defined() || trace.numel() == 0) {
        return original_img.clone();
    }
    TORCH_CHECK(trace.dim() == 3 && trace.size(1) == 2, "draw_trajectories: trace must be [T x 2 x Npts], got ",
        trace.sizes());

    cv::Mat result = original_img.clone();
    torch::Tensor tr = trace.to(torch::kCPU, torch::kFloat32).contiguous();
    auto acc = tr.accessor<float, 3>();
    const int64_t steps = tr.size(0);
    const int64_t npts = tr.size(2);

    for (int64_t i = 0; i < npts; i += std::max(stride, 1)) {
        std::vector<cv::Point> line;
        line.reserve(steps);
        for (int64_t t = 0; t < steps; ++t) {
            // trace 中坐标为 (y, x)
            line.emplace_back(cvRound(acc[t][1][i]), cvRound(acc[t][0][i]));
        }
        cv::polylines(result, line, false, color, 1, cv::LINE_AA);
        cv::circle(result, line.back(), 1, color, cv::FILLED);
    }
    return result;
}
