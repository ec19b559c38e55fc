#include "Dynamics.h"
#include "Flows.h"
#include "Tensor_utils.h"
#include <c10/util/Logging.h>
#include <algorithm>
#include <cstring>

using torch::indexing::Slice;

// =================================================================================
// Internal Helper Functions
// =================================================================================

namespace {

    // 沿 axis 的一阶导数 (np.gradient, edge_order=1)
    torch::Tensor gradient_along(const torch::Tensor& f, int64_t axis) {
        const int64_t L = f.size(axis);
        torch::Tensor out = torch::zeros_like(f);
        if (L < 2) return out;
        if (L > 2) {
            out.narrow(axis, 1, L - 2).copy_((f.narrow(axis, 2, L - 2) - f.narrow(axis, 0, L - 2)) / 2.0);
        }
        out.narrow(axis, 0, 1).copy_(f.narrow(axis, 1, 1) - f.narrow(axis, 0, 1));
        out.narrow(axis, L - 1, 1).copy_(f.narrow(axis, L - 1, 1) - f.narrow(axis, L - 2, 1));
        return out;
    }

    // 记录当前位置 (像素坐标，[D x Npts])
    void push_trace(std::vector<torch::Tensor>& trace, const torch::Tensor& pos) {
        trace.push_back(pos.to(torch::kCPU, torch::kFloat32).clone());
    }
}

// =================================================================================
// Flow Preprocessing
// =================================================================================

torch::Tensor divergence(const torch::Tensor& f) {
    const int64_t d = f.size(0);
    TORCH_CHECK(f.dim() == d + 1, "divergence: expected [D x *shape] with D spatial dims, got ", f.sizes());
    torch::Tensor div = torch::zeros(f.sizes().slice(1), f.options());
    for (int64_t i = 0; i < d; ++i) {
        div = div + gradient_along(f[i], i);
    }
    return div;
}

torch::Tensor div_rescale(const torch::Tensor& dP, const torch::Tensor& mask) {
    torch::Tensor out = dP.to(torch::kFloat32) * mask.to(torch::kFloat32).unsqueeze(0);
    out = normalize_field(out);
    torch::Tensor div = normalize99(divergence(out));
    return out * div.unsqueeze(0);
}

// =================================================================================
// Dynamics Simulation
// =================================================================================

std::tuple<torch::Tensor, torch::Tensor> steps_interp(const torch::Tensor& p, const torch::Tensor& dP, int niter,
    torch::Device device, bool calc_trace) {
    namespace F = torch::nn::functional;

    const int64_t d = dP.size(0);
    TORCH_CHECK(d == 2 || d == 3, "steps_interp: grid_sample supports 2D and 3D flows, got ", d, "D");
    const int64_t npts = p.size(1);

    // grid_sample 的坐标顺序为 (x, y[, z])，与数组轴顺序相反
    std::vector<double> extent(d);
    for (int64_t k = 0; k < d; ++k) {
        extent[k] = static_cast<double>(std::max<int64_t>(dP.size(d - k) - 1, 1));
    }
    torch::Tensor ext = torch::tensor(extent, torch::dtype(torch::kFloat64).device(device));

    // 1. 初始化流场 [1, D, *shape]，分量归一化到 [-1, 1] 坐标系
    torch::Tensor im = dP.flip({ 0 }).to(device, torch::kFloat64).unsqueeze(0).contiguous();
    for (int64_t k = 0; k < d; ++k) {
        im.select(1, k).mul_(2.0 / extent[k]);
    }

    // 2. 初始化点坐标 [Npts, D] -> [-1, 1]
    torch::Tensor pt = p.flip({ 0 }).t().to(device, torch::kFloat64).contiguous();
    pt = (pt / ext) * 2.0 - 1.0;

    std::vector<int64_t> grid_shape(d, 1);
    grid_shape[d - 1] = npts;
    grid_shape.push_back(d);
    grid_shape.insert(grid_shape.begin(), 1);

    auto options = F::GridSampleFuncOptions().mode(torch::kBilinear).padding_mode(torch::kBorder).align_corners(true);
    auto sample = [&](const torch::Tensor& pts) {
        // 输出 [1, D, 1, (1,) Npts] -> [Npts, D]
        return F::grid_sample(im, pts.view(grid_shape), options).reshape({ d, npts }).t();
    };
    auto to_pixels = [&](const torch::Tensor& pts) {
        return ((pts + 1.0) * 0.5 * ext).flip({ 1 }).t();
    };

    std::vector<torch::Tensor> trace;
    if (calc_trace) push_trace(trace, to_pixels(pt));

    // 3. 动力学迭代: 动量平均后按 step_factor 衰减，再截断到图像范围内
    torch::Tensor dPt0 = sample(pt);
    for (int t = 0; t < niter; ++t) {
        torch::Tensor dPt = (sample(pt) + dPt0) / 2.0;
        dPt0 = dPt.clone();
        dPt = dPt / step_factor(t);
        pt = (pt + dPt).clamp(-1.0, 1.0);
        if (calc_trace) push_trace(trace, to_pixels(pt));
    }

    // 4. 反归一化
    torch::Tensor out = to_pixels(pt).to(torch::kCPU, torch::kFloat32).contiguous();
    torch::Tensor tr = calc_trace ? torch::stack(trace) : torch::Tensor();
    return std::make_tuple(out, tr);
}

std::tuple<torch::Tensor, torch::Tensor> steps_nearest(const torch::Tensor& p, const torch::Tensor& dP, int niter,
    torch::Device device, bool calc_trace) {
    const int64_t d = dP.size(0);

    std::vector<int64_t> strides(d, 1);
    std::vector<float> upper(d);
    for (int64_t a = d - 1; a >= 0; --a) {
        upper[a] = static_cast<float>(dP.size(a + 1) - 1);
        if (a < d - 1) strides[a] = strides[a + 1] * dP.size(a + 2);
    }
    torch::Tensor stride_t = torch::tensor(strides, torch::dtype(torch::kInt64).device(device)).unsqueeze(1);
    torch::Tensor upper_t = torch::tensor(upper, torch::dtype(torch::kFloat32).device(device)).unsqueeze(1);

    torch::Tensor flow = dP.to(device, torch::kFloat32).reshape({ d, -1 });
    torch::Tensor pos = p.to(device, torch::kFloat32).clone();

    std::vector<torch::Tensor> trace;
    if (calc_trace) push_trace(trace, pos);

    for (int t = 0; t < niter; ++t) {
        // 位置非负，截断即向下取整
        torch::Tensor idx = (pos.to(torch::kInt64) * stride_t).sum(0);
        torch::Tensor step = flow.index({ Slice(), idx }) / step_factor(t);
        pos = torch::minimum(torch::clamp_min(pos + step, 0.0), upper_t);
        if (calc_trace) push_trace(trace, pos);
    }

    torch::Tensor tr = calc_trace ? torch::stack(trace) : torch::Tensor();
    return std::make_tuple(pos.to(torch::kCPU).contiguous(), tr);
}

AdvectResult follow_flows(const torch::Tensor& dP, const torch::Tensor& mask, const torch::Tensor& inds,
    int niter, bool interp, torch::Device device, bool calc_trace) {
    const int64_t d = dP.size(0);
    TORCH_CHECK(dP.dim() == d + 1, "follow_flows: flow must be [D x *shape] with D spatial dims, got ", dP.sizes());

    AdvectResult res;
    if (inds.defined()) {
        res.inds = inds.to(torch::kCPU, torch::kInt64);
    }
    else if (mask.defined()) {
        TORCH_CHECK(mask.sizes() == dP.sizes().slice(1),
            "follow_flows: mask shape ", mask.sizes(), " does not match flow shape ", dP.sizes());
        res.inds = torch::nonzero(mask.to(torch::kCPU));
    }
    else {
        torch::Tensor mag = dP.to(torch::kCPU, torch::kFloat32).pow(2).sum(0).sqrt();
        res.inds = torch::nonzero(mag > 1e-3);
    }
    TORCH_CHECK(res.inds.dim() == 2 && res.inds.size(1) == d,
        "follow_flows: inds must be [Npts x ", d, "], got ", res.inds.sizes());

    torch::Tensor p = res.inds.t().to(torch::kFloat32).contiguous();
    if (res.inds.size(0) < 5) {
        LOG(WARNING) << "follow_flows: fewer than 5 mask pixels found, points are not advected";
        res.p = p;
        return res;
    }

    if (interp && (d < 2 || d > 3)) {
        LOG(WARNING) << "follow_flows: interpolated dynamics unavailable for " << d << "D, using nearest";
        interp = false;
    }

    if (interp) {
        std::tie(res.p, res.trace) = steps_interp(p, dP, niter, device, calc_trace);
    }
    else {
        std::tie(res.p, res.trace) = steps_nearest(p, dP, niter, device, calc_trace);
    }
    return res;
}

cv::Mat follow_flows(const cv::Mat& dP, const std::vector<cv::Point>& inds, int niter, torch::Device device) {
    if (inds.empty()) return cv::Mat();
    TORCH_CHECK(dP.channels() == 2, "follow_flows: dP must have 2 channels (Y-flow, X-flow)");

    torch::Tensor flow = mat_to_tensor(dP).to(torch::kFloat32);  // [2 x Ly x Lx]
    std::vector<int64_t> yx;
    yx.reserve(inds.size() * 2);
    for (const cv::Point& pt : inds) {
        yx.push_back(pt.y);
        yx.push_back(pt.x);
    }
    torch::Tensor start = torch::tensor(yx, torch::kInt64).view({ static_cast<int64_t>(inds.size()), 2 });

    AdvectResult res = follow_flows(flow, {}, start, niter, true, device, false);

    cv::Mat final_points(static_cast<int>(inds.size()), 1, CV_32FC2);
    torch::Tensor pts = res.p.t().contiguous();  // [N x 2] (y, x)
    std::memcpy(final_points.data, pts.data_ptr<float>(), sizeof(float) * pts.numel());
    return final_points;
}
