#ifndef CELLFLOW_CONFIG_H
#define CELLFLOW_CONFIG_H

#include <torch/torch.h>
#include <cstdint>
#include <vector>

// -------------------------------------------------
// 运行参数与能力标志
// -------------------------------------------------

// 场求解模式: Heat 为点源扩散 (centroid 模型), Eikonal 为平滑距离场
enum class FlowMode {
    Heat,
    Eikonal
};

// 启动时解析一次的运行能力，显式传入各阶段
struct Capabilities {
    torch::Device device = torch::kCPU;
    bool cuda_available = false;

    /**
     * @brief 检测运行环境
     * @param use_gpu 是否请求 GPU，仅在 CUDA 可用时生效
     */
    static Capabilities detect(bool use_gpu = false) {
        Capabilities caps;
        caps.cuda_available = torch::cuda::is_available();
        if (use_gpu && caps.cuda_available) {
            caps.device = torch::Device(torch::kCUDA, 0);
        }
        return caps;
    }
};

// compute_masks 的全部参数
struct MaskParams {
    int niter = 200;                // 动力学迭代次数
    float mask_threshold = 0.0f;    // 距离场前景阈值
    float diam_threshold = 12.0f;   // 平均直径低于此值时启用亚像素聚类
    float flow_threshold = 0.4f;    // 流场一致性阈值，<=0 关闭
    bool interp = true;             // 双线性插值 + 动量
    bool cluster = false;           // 强制 DBSCAN 聚类
    bool do_3D = false;             // 3D 模式下跳过一致性过滤
    int min_size = 15;              // 最小实例像素数，-1 关闭
    std::vector<int64_t> resize;    // 输出尺寸，空表示不缩放
    bool omni = true;               // Eikonal 流程 (div_rescale + get_masks)，关闭时用直方图种子
    bool calc_trace = false;        // 记录轨迹
    bool verbose = false;
    int nclasses = 3;               // 网络输出类别数，4 表示带边界场
    int dim = 2;
    int hole_size = 3;              // 孔洞面积占实例面积的百分比
};

#endif // CELLFLOW_CONFIG_H
