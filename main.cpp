#include <opencv2/opencv.hpp>
#include <c10/util/Logging.h>
#include <iostream>
#include <string>
#include "Cellflow_core.h"
#include "Tensor_utils.h"
#include "Visualize.h"

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <labels.png|tif> [out_prefix] [-v] [--gpu]" << std::endl;
}

int main(int argc, char** argv) {
    std::string label_path;
    std::string out_prefix = "cellflow";
    bool verbose = false;
    bool use_gpu = false;

    int positional = 0;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-v") verbose = true;
        else if (arg == "--gpu") use_gpu = true;
        else if (positional == 0) { label_path = arg; ++positional; }
        else if (positional == 1) { out_prefix = arg; ++positional; }
        else {
            print_usage(argv[0]);
            return -1;
        }
    }
    if (label_path.empty()) {
        print_usage(argv[0]);
        return -1;
    }
    if (verbose) c10::ShowLogInfoToStderr();

    // 读取标签图 (保持 16 位深度)
    cv::Mat label_img = cv::imread(label_path, cv::IMREAD_ANYDEPTH);
    if (label_img.empty()) {
        std::cerr << "Error reading image: " << label_path << std::endl;
        return -1;
    }

    try {
        Capabilities caps = Capabilities::detect(use_gpu);
        LOG(INFO) << "Running on " << caps.device;

        torch::Tensor labels = renumber(mat_to_tensor(label_img));
        const int64_t nd = labels.dim();

        // 1. 标签 -> 训练目标 (平滑距离场 + 5 倍流场)
        torch::Tensor target = training_target(labels, 5.0, caps.device);
        torch::Tensor dist = target[3];
        torch::Tensor dP = target.narrow(0, 5, nd);

        // 2. 流场 -> 标签
        MaskParams params;
        params.verbose = verbose;
        params.calc_trace = true;
        MaskResult res = compute_masks(dP, dist, {}, {}, {}, params, caps);

        std::cout << "input instances: " << labels.max().item<int64_t>()
                  << ", reconstructed instances: " << res.masks.max().item<int64_t>() << std::endl;

        // 3. 保存结果
        cv::Mat masks = tensor_to_mat(res.masks);
        cv::Mat masks_16u;
        masks.convertTo(masks_16u, CV_16U);
        cv::imwrite(out_prefix + "_masks.png", masks_16u);

        cv::Mat flow = tensor_to_mat(dP);
        cv::Mat flow_color = flow_to_color_image(flow, 0.2);
        cv::imwrite(out_prefix + "_flow.png", flow_color);

        // 重建结果着色，叠加输入标签的轮廓
        cv::Mat color_mask_img = masks_to_color_image(masks);
        cv::Mat contour_overlay = draw_contours_on_image(color_mask_img, tensor_to_mat(labels));
        cv::imwrite(out_prefix + "_labels.png", contour_overlay);

        cv::imwrite(out_prefix + "_trace.png", draw_trajectories(flow_color, res.trace, 10));
    }
    catch (const c10::Error& e) {
        std::cerr << "Error: " << e.what_without_backtrace() << std::endl;
        return -1;
    }

    return 0;
}
