#include "Flow_error.h"
#include "Flows.h"
#include "Tensor_utils.h"

FlowErrorResult flow_error(const torch::Tensor& masks, const torch::Tensor& dP_net,
    FlowMode mode, torch::Device device) {
    TORCH_CHECK(dP_net.dim() == masks.dim() + 1 && dP_net.sizes().slice(1) == masks.sizes(),
        "flow_error: net flow ", dP_net.sizes(), " is not the same size as predicted masks ", masks.sizes());

    FlowErrorResult res;
    torch::Tensor maski = renumber(masks.to(torch::kCPU));
    const int64_t K = maski.numel() > 0 ? maski.max().item<int64_t>() : 0;

    // 1. 由预测标签重新计算流场
    res.dP_masks = masks_to_flows(maski, {}, mode, device).flow;

    // 2. 逐实例平均平方误差
    torch::Tensor diff = (res.dP_masks - dP_net.to(torch::kCPU, torch::kFloat32) / 5.0).pow(2).sum(0).flatten();
    torch::Tensor lab = maski.flatten();
    torch::Tensor sums = torch::zeros({ K + 1 }, torch::kFloat64);
    sums.index_add_(0, lab, diff.to(torch::kFloat64));
    torch::Tensor counts = torch::bincount(lab, {}, K + 1).to(torch::kFloat64);

    res.errors = (sums / counts.clamp_min(1)).narrow(0, 1, K).to(torch::kFloat32);
    return res;
}

torch::Tensor remove_bad_flow_masks(const torch::Tensor& masks, const torch::Tensor& flows, float threshold,
    FlowMode mode, torch::Device device) {
    torch::Tensor maski = renumber(masks.to(torch::kCPU));
    FlowErrorResult fe = flow_error(maski, flows, mode, device);

    // 误差大于阈值的实例置 0
    torch::Tensor bad = torch::cat({ torch::zeros({ 1 }, torch::kBool), fe.errors > threshold });
    torch::Tensor out = maski.masked_fill(bad.index({ maski }), 0);
    return renumber(out);
}
