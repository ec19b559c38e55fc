#include "Tensor_utils.h"
#include <algorithm>
#include <cmath>
#include <tuple>

// =================================================================================
// Internal Helper Functions
// =================================================================================

namespace {

    // 沿 axis 平移一个像素，移出图像的位置用 fill 补齐
    torch::Tensor shifted(const torch::Tensor& m, int64_t axis, int64_t dir, bool fill) {
        const int64_t L = m.size(axis);
        torch::Tensor out = torch::full_like(m, fill);
        if (L <= 1) return out;
        if (dir > 0) {
            out.narrow(axis, 1, L - 1).copy_(m.narrow(axis, 0, L - 1));
        }
        else {
            out.narrow(axis, 0, L - 1).copy_(m.narrow(axis, 1, L - 1));
        }
        return out;
    }

    // 已排序一维数组的线性插值分位数
    double sorted_percentile(const torch::Tensor& sorted, double q) {
        const int64_t n = sorted.numel();
        const double pos = q * static_cast<double>(n - 1);
        const int64_t lo = static_cast<int64_t>(std::floor(pos));
        const int64_t hi = std::min(lo + 1, n - 1);
        const double frac = pos - static_cast<double>(lo);
        const double vlo = sorted[lo].item<double>();
        const double vhi = sorted[hi].item<double>();
        return vlo + frac * (vhi - vlo);
    }
}

// =================================================================================
// OpenCV <-> LibTorch
// =================================================================================

torch::Tensor mat_to_tensor(const cv::Mat& mat) {
    TORCH_CHECK(!mat.empty(), "mat_to_tensor: input is empty");
    TORCH_CHECK(mat.dims == 2, "mat_to_tensor: only 2D cv::Mat is supported, got ", mat.dims, " dims");

    cv::Mat src = mat;
    torch::ScalarType dtype;
    switch (mat.depth()) {
    case CV_8U:
        dtype = torch::kUInt8;
        break;
    case CV_16U:
    case CV_16S:
        mat.convertTo(src, CV_MAKETYPE(CV_32S, mat.channels()));
        dtype = torch::kInt32;
        break;
    case CV_32S:
        dtype = torch::kInt32;
        break;
    case CV_32F:
        dtype = torch::kFloat32;
        break;
    case CV_64F:
        dtype = torch::kFloat64;
        break;
    default:
        TORCH_CHECK(false, "mat_to_tensor: unsupported cv::Mat depth ", mat.depth());
    }
    if (!src.isContinuous()) src = src.clone();

    const int channels = src.channels();
    torch::Tensor t = torch::from_blob(src.data, { src.rows, src.cols, channels }, dtype).clone();
    if (channels == 1) return t.squeeze(-1);
    return t.permute({ 2, 0, 1 }).contiguous();
}

cv::Mat tensor_to_mat(const torch::Tensor& t) {
    TORCH_CHECK(t.dim() == 2 || t.dim() == 3, "tensor_to_mat: expected [H x W] or [C x H x W], got ", t.sizes());

    torch::Tensor src = t.detach().to(torch::kCPU);
    int depth = CV_8U;
    switch (src.scalar_type()) {
    case torch::kBool:
        src = src.to(torch::kUInt8);
        depth = CV_8U;
        break;
    case torch::kUInt8:
        depth = CV_8U;
        break;
    case torch::kInt32:
        depth = CV_32S;
        break;
    case torch::kInt64:
        src = src.to(torch::kInt32);
        depth = CV_32S;
        break;
    case torch::kFloat32:
        depth = CV_32F;
        break;
    case torch::kFloat64:
        depth = CV_64F;
        break;
    default:
        TORCH_CHECK(false, "tensor_to_mat: unsupported dtype ", src.scalar_type());
    }

    const int channels = src.dim() == 3 ? static_cast<int>(src.size(0)) : 1;
    if (src.dim() == 3) src = src.permute({ 1, 2, 0 });
    src = src.contiguous();

    cv::Mat view(static_cast<int>(src.size(0)), static_cast<int>(src.size(1)),
        CV_MAKETYPE(depth, channels), src.data_ptr());
    return view.clone();
}

// =================================================================================
// Padding
// =================================================================================

std::vector<int64_t> c_strides(at::IntArrayRef shape) {
    std::vector<int64_t> strides(shape.size(), 1);
    for (int64_t a = static_cast<int64_t>(shape.size()) - 2; a >= 0; --a) {
        strides[a] = strides[a + 1] * shape[a + 1];
    }
    return strides;
}

torch::Tensor pad_zero(const torch::Tensor& t, int64_t pad, int64_t ndim) {
    std::vector<int64_t> pads(2 * ndim, pad);
    return torch::constant_pad_nd(t, pads, 0);
}

torch::Tensor pad_reflect(const torch::Tensor& t, int64_t pad, int64_t ndim) {
    torch::Tensor out = t;
    if (pad <= 0) return out;

    for (int64_t axis = t.dim() - ndim; axis < t.dim(); ++axis) {
        const int64_t L = t.size(axis);
        std::vector<int64_t> idx;
        idx.reserve(L + 2 * pad);
        const int64_t period = 2 * (L - 1);
        for (int64_t j = -pad; j < L + pad; ++j) {
            if (L == 1) {
                idx.push_back(0);
                continue;
            }
            int64_t m = j % period;
            if (m < 0) m += period;
            idx.push_back(m < L ? m : period - m);
        }
        torch::Tensor index = torch::tensor(idx, torch::dtype(torch::kInt64).device(t.device()));
        out = out.index_select(axis, index);
    }
    return out;
}

torch::Tensor unpad(const torch::Tensor& t, int64_t pad, int64_t ndim) {
    torch::Tensor out = t;
    for (int64_t axis = t.dim() - ndim; axis < t.dim(); ++axis) {
        out = out.narrow(axis, pad, t.size(axis) - 2 * pad);
    }
    return out;
}

// =================================================================================
// Labels
// =================================================================================

torch::Tensor renumber(const torch::Tensor& labels) {
    torch::Tensor flat = labels.to(torch::kInt64).flatten();
    if (flat.numel() == 0) return flat.view(labels.sizes());

    torch::Tensor uniq, inverse;
    std::tie(uniq, inverse) = torch::_unique(flat, /*sorted=*/true, /*return_inverse=*/true);
    // 最小值不是 0 说明没有背景，编号整体后移
    if (uniq[0].item<int64_t>() != 0) inverse = inverse + 1;
    return inverse.view(labels.sizes());
}

torch::Tensor normalize99(const torch::Tensor& x) {
    torch::Tensor xf = x.to(torch::kFloat64);
    if (xf.numel() == 0) return x;

    torch::Tensor sorted = std::get<0>(xf.flatten().sort()).cpu();
    const double lo = sorted_percentile(sorted, 0.01);
    const double hi = sorted_percentile(sorted, 0.99);
    torch::Tensor out = xf - lo;
    if (hi - lo > 0) out = out / (hi - lo);
    return out.to(x.is_floating_point() ? x.scalar_type() : torch::kFloat32);
}

// =================================================================================
// Morphology
// =================================================================================

torch::Tensor binary_dilation(const torch::Tensor& mask, int iterations, bool border_value) {
    torch::Tensor m = mask.to(torch::kBool);
    for (int it = 0; it < iterations; ++it) {
        torch::Tensor out = m.clone();
        for (int64_t axis = 0; axis < m.dim(); ++axis) {
            out = out.logical_or(shifted(m, axis, 1, border_value));
            out = out.logical_or(shifted(m, axis, -1, border_value));
        }
        m = out;
    }
    return m;
}

torch::Tensor binary_erosion(const torch::Tensor& mask, int iterations, bool border_value) {
    torch::Tensor m = mask.to(torch::kBool);
    for (int it = 0; it < iterations; ++it) {
        torch::Tensor out = m.clone();
        for (int64_t axis = 0; axis < m.dim(); ++axis) {
            out = out.logical_and(shifted(m, axis, 1, border_value));
            out = out.logical_and(shifted(m, axis, -1, border_value));
        }
        m = out;
    }
    return m;
}

torch::Tensor binary_opening(const torch::Tensor& mask, int iterations) {
    return binary_dilation(binary_erosion(mask, iterations, false), iterations, false);
}

torch::Tensor border_frame(at::IntArrayRef shape, int64_t width) {
    const int64_t nd = static_cast<int64_t>(shape.size());
    torch::Tensor frame = torch::zeros(shape, torch::kBool);
    for (int64_t axis = 0; axis < nd; ++axis) {
        const int64_t L = shape[axis];
        torch::Tensor idx = torch::arange(L);
        torch::Tensor edge = (idx < width).logical_or(idx >= L - width);
        std::vector<int64_t> view(nd, 1);
        view[axis] = L;
        frame = frame.logical_or(edge.view(view));
    }
    return frame;
}

// =================================================================================
// Resampling
// =================================================================================

torch::Tensor resize_nearest(const torch::Tensor& labels, const std::vector<int64_t>& shape) {
    TORCH_CHECK(static_cast<int64_t>(shape.size()) == labels.dim(),
        "resize_nearest: target shape has ", shape.size(), " dims, labels have ", labels.dim());

    torch::Tensor out = labels;
    for (int64_t axis = 0; axis < labels.dim(); ++axis) {
        const int64_t L = labels.size(axis);
        const int64_t Lo = shape[axis];
        TORCH_CHECK(Lo > 0, "resize_nearest: target size must be positive");
        std::vector<int64_t> idx(Lo, 0);
        if (Lo > 1) {
            const double scale = static_cast<double>(L - 1) / static_cast<double>(Lo - 1);
            for (int64_t j = 0; j < Lo; ++j) {
                idx[j] = std::min(L - 1, static_cast<int64_t>(std::lround(j * scale)));
            }
        }
        torch::Tensor index = torch::tensor(idx, torch::dtype(torch::kInt64).device(labels.device()));
        out = out.index_select(axis, index);
    }
    return out;
}

torch::Tensor gaussian_filter(const torch::Tensor& x, double sigma) {
    namespace F = torch::nn::functional;

    const int64_t radius = static_cast<int64_t>(4.0 * sigma + 0.5);
    torch::Tensor r = torch::arange(-radius, radius + 1, torch::dtype(torch::kFloat64).device(x.device()));
    torch::Tensor kernel = torch::exp(-0.5 * (r / sigma).pow(2));
    kernel = (kernel / kernel.sum()).view({ 1, 1, -1 });

    torch::Tensor out = x.to(torch::kFloat64);
    for (int64_t axis = 0; axis < out.dim(); ++axis) {
        torch::Tensor moved = out.movedim(axis, -1).contiguous();
        std::vector<int64_t> sizes = moved.sizes().vec();
        torch::Tensor lines = moved.reshape({ -1, 1, sizes.back() });
        lines = F::pad(lines, F::PadFuncOptions({ radius, radius }).mode(torch::kReplicate));
        lines = torch::conv1d(lines, kernel);
        out = lines.reshape(sizes).movedim(-1, axis);
    }
    return out.to(x.scalar_type() == torch::kFloat64 ? torch::kFloat64 : torch::kFloat32);
}
