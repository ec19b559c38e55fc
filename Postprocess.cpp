#include "Postprocess.h"
#include "Tensor_utils.h"
#include <algorithm>
#include <vector>

// =================================================================================
// Internal Helper Functions
// =================================================================================

namespace {

    // 每个标签的包围盒 [lo, hi)，对应 find_objects
    struct BoundingBox {
        std::vector<int64_t> lo;
        std::vector<int64_t> hi;
        bool empty() const { return lo.empty(); }
    };

    std::vector<BoundingBox> find_objects(const torch::Tensor& labels, int64_t K) {
        std::vector<BoundingBox> boxes(K + 1);
        const int64_t nd = labels.dim();
        const std::vector<int64_t> shape = labels.sizes().vec();
        const int64_t* data = labels.data_ptr<int64_t>();

        std::vector<int64_t> coord(nd, 0);
        for (int64_t i = 0; i < labels.numel(); ++i) {
            const int64_t v = data[i];
            if (v > 0) {
                BoundingBox& b = boxes[v];
                if (b.empty()) {
                    b.lo = coord;
                    b.hi.resize(nd);
                    for (int64_t a = 0; a < nd; ++a) b.hi[a] = coord[a] + 1;
                }
                else {
                    for (int64_t a = 0; a < nd; ++a) {
                        b.lo[a] = std::min(b.lo[a], coord[a]);
                        b.hi[a] = std::max(b.hi[a], coord[a] + 1);
                    }
                }
            }
            for (int64_t a = nd - 1; a >= 0; --a) {
                if (++coord[a] < shape[a]) break;
                coord[a] = 0;
            }
        }
        return boxes;
    }

    torch::Tensor crop(const torch::Tensor& t, const BoundingBox& b) {
        torch::Tensor out = t;
        for (int64_t a = 0; a < t.dim(); ++a) {
            out = out.narrow(a, b.lo[a], b.hi[a] - b.lo[a]);
        }
        return out;
    }

    // 2D 布尔 Tensor 填充孔洞
    torch::Tensor fill_holes_2d(const torch::Tensor& msk, double max_hole_area) {
        cv::Mat filled = fill_holes_single_mask(tensor_to_mat(msk), max_hole_area);
        return mat_to_tensor(filled) > 0;
    }
}

// =================================================================================
// Hole Filling
// =================================================================================

cv::Mat fill_holes_single_mask(const cv::Mat& mask_binary, double max_hole_area) {
    if (mask_binary.empty()) return cv::Mat();
    TORCH_CHECK(mask_binary.channels() == 1, "fill_holes_single_mask: mask must be single channel");

    cv::Mat mask_u8 = mask_binary != 0;

    // 1. 零填充一个像素，使外部背景连成一片
    cv::Mat padded;
    cv::copyMakeBorder(mask_u8, padded, 1, 1, 1, 1, cv::BORDER_CONSTANT, cv::Scalar(0));

    // 2. 背景的 4 邻接连通域
    cv::Mat background = padded == 0;
    cv::Mat cc, stats, centroids;
    const int n = cv::connectedComponentsWithStats(background, cc, stats, centroids, 4, CV_32S);

    // 3. 不接触边缘且面积足够小的分量为孔洞
    std::vector<uchar> is_hole(n, 0);
    for (int i = 1; i < n; ++i) {
        const int x = stats.at<int>(i, cv::CC_STAT_LEFT);
        const int y = stats.at<int>(i, cv::CC_STAT_TOP);
        const int w = stats.at<int>(i, cv::CC_STAT_WIDTH);
        const int h = stats.at<int>(i, cv::CC_STAT_HEIGHT);
        const int area = stats.at<int>(i, cv::CC_STAT_AREA);
        const bool touches_edge = x == 0 || y == 0 || x + w == padded.cols || y + h == padded.rows;
        if (touches_edge) continue;
        if (max_hole_area >= 0 && area >= max_hole_area) continue;
        is_hole[i] = 1;
    }

    for (int r = 0; r < padded.rows; ++r) {
        const int* cc_row = cc.ptr<int>(r);
        uchar* row = padded.ptr<uchar>(r);
        for (int c = 0; c < padded.cols; ++c) {
            if (is_hole[cc_row[c]]) row[c] = 255;
        }
    }
    return padded(cv::Rect(1, 1, mask_u8.cols, mask_u8.rows)).clone();
}

// =================================================================================
// Label Cleanup
// =================================================================================

torch::Tensor remove_small_masks(const torch::Tensor& masks, int min_size) {
    torch::Tensor m = renumber(masks.to(torch::kCPU));
    if (min_size <= 0 || m.numel() == 0) return m;

    const int64_t K = m.max().item<int64_t>();
    torch::Tensor counts = torch::bincount(m.flatten(), {}, K + 1);
    torch::Tensor small = counts < min_size;
    small[0].fill_(false);
    return renumber(m.masked_fill(small.index({ m }), 0));
}

torch::Tensor fill_holes_and_remove_small_masks(const torch::Tensor& masks, int min_size, int hole_size,
    double scale_factor) {
    TORCH_CHECK(masks.dim() == 2 || masks.dim() == 3,
        "fill_holes_and_remove_small_masks takes 2D or 3D array, not ", masks.dim(), "D array");

    // 1. 整数化、重编号并移除小实例
    torch::Tensor m = remove_small_masks(masks, min_size).contiguous();
    if (m.numel() == 0) return m;

    const double hole_pct = hole_size * scale_factor;
    const int64_t K = m.max().item<int64_t>();
    std::vector<BoundingBox> boxes = find_objects(m, K);

    // 2. 逐实例在包围盒内处理
    int64_t j = 0;
    for (int64_t i = 1; i <= K; ++i) {
        if (boxes[i].empty()) continue;
        torch::Tensor region = crop(m, boxes[i]);
        torch::Tensor msk = region == i;
        const int64_t npix = msk.sum().item<int64_t>();
        if (npix == 0) continue;
        if (min_size > 0 && npix < min_size) {
            region.masked_fill_(msk, 0);
            continue;
        }

        if (msk.dim() == 3) {
            for (int64_t k = 0; k < msk.size(0); ++k) {
                msk[k].copy_(fill_holes_2d(msk[k], -1.0));
            }
        }
        else {
            // 孔洞阈值按填满全部孔洞后的面积计算，重复调用结果不变
            const int64_t filled_area = fill_holes_2d(msk, -1.0).sum().item<int64_t>();
            const double hsz = static_cast<double>(filled_area) * hole_pct / 100.0;
            msk = fill_holes_2d(msk, hsz);
        }
        region.masked_fill_(msk, ++j);
    }

    // 3. 重编号
    return renumber(m);
}

cv::Mat fill_holes_and_remove_small_masks(const cv::Mat& masks_in, int min_size, int hole_size) {
    if (masks_in.empty()) return masks_in;
    TORCH_CHECK(masks_in.channels() == 1, "fill_holes_and_remove_small_masks: masks must be single channel");

    torch::Tensor masks = mat_to_tensor(masks_in).to(torch::kInt64);
    torch::Tensor out = fill_holes_and_remove_small_masks(masks, min_size, hole_size, 1.0);
    return tensor_to_mat(out);
}
