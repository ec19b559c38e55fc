#include "Cellflow_core.h"
#include "Distance.h"
#include "Dynamics.h"
#include "Flow_error.h"
#include "Flows.h"
#include "Postprocess.h"
#include "Reconstruct.h"
#include "Tensor_utils.h"
#include <c10/util/Logging.h>

// ====================================================================
// 核心函数 compute_masks
// ====================================================================

MaskResult compute_masks(const torch::Tensor& dP, const torch::Tensor& dist, const torch::Tensor& bd,
    const torch::Tensor& p, const torch::Tensor& inds, const MaskParams& params, const Capabilities& caps) {
    const int64_t nd = dist.dim();
    TORCH_CHECK(dP.dim() == nd + 1 && dP.size(0) == nd && dP.sizes().slice(1) == dist.sizes(),
        "compute_masks: flow ", dP.sizes(), " does not match distance field ", dist.sizes());
    if (params.verbose) LOG(INFO) << "mask_threshold is " << params.mask_threshold;

    // 1. 前景阈值化
    torch::Tensor dist_cpu = dist.to(torch::kCPU, torch::kFloat32);
    torch::Tensor mask;
    if (params.omni || inds.defined()) {
        if (params.verbose) LOG(INFO) << "Using hysteresis threshold.";
        mask = hysteresis_threshold(dist_cpu, params.mask_threshold - 1.0, params.mask_threshold);
    }
    else {
        mask = dist_cpu > params.mask_threshold;
    }

    MaskResult res;
    if (!mask.any().item<bool>()) {
        LOG(INFO) << "No cell pixels found.";
        std::vector<int64_t> shape = params.resize.empty() ? dist.sizes().vec() : params.resize;
        res.masks = torch::zeros(shape, torch::kInt64);
        res.p = torch::zeros({ nd, 0 }, torch::kFloat32);
        return res;
    }

    // 2. Flow 预处理
    torch::Tensor dP_cpu = dP.to(torch::kCPU, torch::kFloat32);
    torch::Tensor dP_;
    if (params.omni) {
        dP_ = div_rescale(dP_cpu, mask);
        if (params.dim > 2) LOG(WARNING) << "compute_masks: divergence rescaling is not tuned for 3D flows";
    }
    else {
        dP_ = dP_cpu * mask.unsqueeze(0) / 5.0;
    }

    // 3. 动力学迭代
    torch::Tensor pix;
    if (!p.defined()) {
        AdvectResult adv = follow_flows(dP_, mask, inds, params.niter, params.interp, caps.device, params.calc_trace);
        res.p = adv.p;
        res.trace = adv.trace;
        pix = adv.inds;
    }
    else {
        pix = torch::nonzero(mask);
        TORCH_CHECK(p.dim() == 2 && p.size(0) == nd && p.size(1) == pix.size(0),
            "compute_masks: supplied p ", p.sizes(), " does not match ", pix.size(0), " foreground pixels");
        res.p = p.to(torch::kCPU, torch::kFloat32);
        if (params.verbose) LOG(INFO) << "p given";
    }

    // 4. 生成 Mask: Eikonal 流程按骨架连通域 / 聚类，否则按收敛点直方图取种子
    torch::Tensor masks;
    if (params.omni) {
        masks = get_masks(res.p, bd, dist_cpu, mask, pix, params.nclasses, params.cluster,
            params.diam_threshold, params.verbose);
    }
    else {
        masks = get_masks_histogram(res.p, pix, mask.sizes());
    }

    // 5. 流场一致性过滤
    if (!params.do_3D && params.flow_threshold > 0 && masks.max().item<int64_t>() > 0) {
        const FlowMode mode = params.omni ? FlowMode::Eikonal : FlowMode::Heat;
        masks = remove_bad_flow_masks(masks, dP_cpu, params.flow_threshold, mode, caps.device);
        masks = renumber(masks);
    }

    // 6. 缩放
    if (!params.resize.empty()) {
        if (params.verbose) LOG(INFO) << "resizing output with resize = " << c10::IntArrayRef(params.resize);
        masks = resize_nearest(masks, params.resize);
    }

    // 7. 后处理：填补孔洞 & 移除小区域
    masks = fill_holes_and_remove_small_masks(masks, params.min_size, params.hole_size);
    res.masks = renumber(masks);
    return res;
}

cv::Mat compute_masks(const cv::Mat& dP, const cv::Mat& dist, const cv::Mat& bd,
    const MaskParams& params, const Capabilities& caps) {
    TORCH_CHECK(dP.channels() == 2, "compute_masks: dP must have 2 channels (Y-flow, X-flow)");
    TORCH_CHECK(dist.channels() == 1 && dist.size() == dP.size(),
        "compute_masks: dist must be single channel with the same size as dP");

    torch::Tensor dP_t = mat_to_tensor(dP).to(torch::kFloat32);
    torch::Tensor dist_t = mat_to_tensor(dist).to(torch::kFloat32);
    torch::Tensor bd_t = bd.empty() ? torch::Tensor() : mat_to_tensor(bd).to(torch::kFloat32);

    MaskResult res = compute_masks(dP_t, dist_t, bd_t, {}, {}, params, caps);
    return tensor_to_mat(res.masks);
}

// ====================================================================
// 训练数据
// ====================================================================

torch::Tensor labels_to_flows(const torch::Tensor& labels, FlowMode mode, torch::Device device, int dim) {
    FlowResult fr = masks_to_flows(labels, {}, mode, device, dim);
    return torch::cat({
        fr.labels.unsqueeze(0).to(torch::kFloat32),
        fr.dist.unsqueeze(0).to(torch::kFloat32),
        fr.flow.to(torch::kFloat32),
        fr.potential.unsqueeze(0).to(torch::kFloat32) });
}

torch::Tensor training_target(const torch::Tensor& labels, double dist_bg, torch::Device device) {
    torch::Tensor masks = renumber(labels.to(torch::kCPU));
    TORCH_CHECK(masks.gt(0).any().item<bool>(), "training_target: labels contain no foreground");

    // 1. 距离场与流场
    FlowResult fr = masks_to_flows(masks, {}, FlowMode::Eikonal, device);
    torch::Tensor fg = (masks > 0).to(torch::kFloat32);
    torch::Tensor bd = (fr.dist == 1.0f).to(torch::kFloat32);

    // 2. 平滑距离场，背景取 -dist_bg
    torch::Tensor smooth = smooth_distance(masks, fr.dist, device).to(torch::kFloat32);
    smooth = smooth.masked_fill(fr.dist <= 0, -dist_bg);

    // 3. 背景权重: 靠近细胞处权重更高
    const double cutoff = 9.0;
    torch::Tensor bg_edt = edt((masks == 0).to(torch::kInt64), true);
    torch::Tensor weight = gaussian_filter(1.0 - bg_edt.clamp(0.0, cutoff) / cutoff, 1.0) + 0.5;

    torch::Tensor flows = 5.0 * fr.flow * fg.unsqueeze(0);
    return torch::cat({
        torch::stack({ masks.to(torch::kFloat32), fg, bd, smooth, weight.to(torch::kFloat32) }),
        flows.to(torch::kFloat32) });
}
