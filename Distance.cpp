#include "Distance.h"
#include <ATen/Parallel.h>
#include <algorithm>
#include <cmath>
#include <vector>

// edt.hpp 定义了宏 sq(x)，放在最后包含
#include <edt.hpp>

// =================================================================================
// Distance Transform
// =================================================================================

torch::Tensor edt(const torch::Tensor& labels, bool black_border) {
    TORCH_CHECK(labels.dim() >= 1, "edt: labels must have at least one dimension");

    torch::Tensor lab = labels.to(torch::kCPU).to(torch::kInt64).contiguous();
    torch::Tensor out = torch::zeros(lab.sizes(), torch::kFloat32);
    const size_t total = static_cast<size_t>(lab.numel());
    if (total == 0) return out.to(labels.device());

    const size_t nd = static_cast<size_t>(lab.dim());
    std::vector<size_t> shape(nd), strides(nd);
    for (size_t a = 0; a < nd; ++a) {
        shape[a] = static_cast<size_t>(lab.size(a));
        strides[a] = static_cast<size_t>(lab.stride(a));
    }

    int64_t* seg = lab.data_ptr<int64_t>();
    float* f = out.data_ptr<float>();
    const int parallel = std::max(1, at::get_num_threads());

    // 第一遍在最后一个轴 (步长为 1)，不同标签之间互为边界
    pyedt::_nd_pass_multi<int64_t>(seg, f, nd, shape.data(), strides.data(), nd - 1, 1.0f, black_border, parallel);

    // 后续各轴: 按同标签连续段求抛物线下包络
    if (!black_border) pyedt::tofinite(f, total);
    for (size_t pass = 1; pass < nd; ++pass) {
        const size_t axis = nd - 1 - pass;
        pyedt::_nd_pass_parabolic<int64_t>(seg, f, nd, shape.data(), strides.data(), axis, 1.0f, black_border, parallel);
    }
    if (!black_border) pyedt::toinfinite(f, total);

    // 没有边界约束的段保持无穷远
    return out.sqrt_().to(labels.device());
}

// =================================================================================
// Scale Estimates
// =================================================================================

double dist_to_diam(const torch::Tensor& dt_pos, int64_t n) {
    TORCH_CHECK(dt_pos.numel() > 0, "dist_to_diam: no foreground distance values");
    return 2.0 * static_cast<double>(n + 1) * dt_pos.to(torch::kFloat64).mean().item<double>();
}

double diameters(const torch::Tensor& labels, double dist_threshold) {
    torch::Tensor dt = edt(labels);
    torch::Tensor dt_pos = dt.masked_select(dt > dist_threshold).abs();
    TORCH_CHECK(dt_pos.numel() > 0, "diameters: label image has no foreground pixels above distance ", dist_threshold);
    return dist_to_diam(dt_pos, labels.dim());
}

int64_t get_niter(const torch::Tensor& dists) {
    TORCH_CHECK(dists.numel() > 0, "get_niter: empty distance field");
    const double dmax = dists.max().item<double>();
    TORCH_CHECK(std::isfinite(dmax), "get_niter: distance field maximum is not finite");
    return static_cast<int64_t>(std::ceil(dmax * 1.16)) + 1;
}
