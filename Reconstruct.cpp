#include "Reconstruct.h"
#include "Distance.h"
#include "Stencil.h"
#include "Tensor_utils.h"
#include <c10/util/Logging.h>
#include <opencv2/flann.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <unordered_map>
#include <vector>

// =================================================================================
// Internal Helper Functions
// =================================================================================

namespace {

    // 并查集，根节点始终是集合中下标最小的元素
    class DisjointSet {
    public:
        explicit DisjointSet(int64_t n) : parent_(n) {
            std::iota(parent_.begin(), parent_.end(), 0);
        }

        int64_t find(int64_t x) {
            while (parent_[x] != x) {
                parent_[x] = parent_[parent_[x]];
                x = parent_[x];
            }
            return x;
        }

        void unite(int64_t a, int64_t b) {
            a = find(a);
            b = find(b);
            if (a == b) return;
            if (a < b) parent_[b] = a;
            else parent_[a] = b;
        }

    private:
        std::vector<int64_t> parent_;
    };

    double squared_distance(const double* a, const double* b, int64_t d) {
        double s = 0.0;
        for (int64_t k = 0; k < d; ++k) {
            const double t = a[k] - b[k];
            s += t * t;
        }
        return s;
    }

    // DBSCAN 的均匀网格: 边长 eps/sqrt(D)，同一格内的点两两距离小于 eps
    struct ClusterGrid {
        std::vector<std::vector<int64_t>> members;     // 每个格子内的点
        std::vector<std::vector<int64_t>> neighbors;   // 每个格子的相邻格子 (含自身)
        std::vector<int64_t> cell_of;                  // 每个点所在格子
    };

    ClusterGrid build_grid(const double* pts, int64_t n, int64_t d, double eps) {
        ClusterGrid grid;
        const double h = eps / std::sqrt(static_cast<double>(d));

        std::vector<double> lo(d, 0.0);
        for (int64_t k = 0; k < d; ++k) {
            lo[k] = pts[k];
            for (int64_t i = 1; i < n; ++i) lo[k] = std::min(lo[k], pts[i * d + k]);
        }

        // 1. 计算格子坐标并线性化
        std::vector<int64_t> coords(n * d);
        std::vector<int64_t> extent(d, 1);
        for (int64_t i = 0; i < n; ++i) {
            for (int64_t k = 0; k < d; ++k) {
                const int64_t c = static_cast<int64_t>(std::floor((pts[i * d + k] - lo[k]) / h));
                coords[i * d + k] = c;
                extent[k] = std::max(extent[k], c + 1);
            }
        }
        std::vector<int64_t> strides = c_strides(extent);

        std::unordered_map<int64_t, int64_t> cell_index;
        std::vector<std::vector<int64_t>> cell_coords;
        grid.cell_of.resize(n);
        for (int64_t i = 0; i < n; ++i) {
            int64_t key = 0;
            for (int64_t k = 0; k < d; ++k) key += coords[i * d + k] * strides[k];
            auto it = cell_index.find(key);
            if (it == cell_index.end()) {
                it = cell_index.emplace(key, static_cast<int64_t>(grid.members.size())).first;
                grid.members.emplace_back();
                cell_coords.emplace_back(coords.begin() + i * d, coords.begin() + (i + 1) * d);
            }
            grid.members[it->second].push_back(i);
            grid.cell_of[i] = it->second;
        }

        // 2. 相邻格子: 每轴相差不超过 ceil(sqrt(D))
        const int radius = static_cast<int>(std::ceil(std::sqrt(static_cast<double>(d))));
        torch::Tensor offsets = neighbor_offsets(static_cast<int>(d), radius);
        auto off = offsets.accessor<int64_t, 2>();
        grid.neighbors.resize(grid.members.size());
        for (size_t c = 0; c < cell_coords.size(); ++c) {
            for (int64_t j = 0; j < offsets.size(0); ++j) {
                int64_t key = 0;
                bool inside = true;
                for (int64_t k = 0; k < d; ++k) {
                    const int64_t v = cell_coords[c][k] + off[j][k];
                    if (v < 0 || v >= extent[k]) {
                        inside = false;
                        break;
                    }
                    key += v * strides[k];
                }
                if (!inside) continue;
                auto it = cell_index.find(key);
                if (it != cell_index.end()) grid.neighbors[c].push_back(it->second);
            }
        }
        return grid;
    }
}

// =================================================================================
// Connected Components
// =================================================================================

std::tuple<torch::Tensor, int64_t> label_components(const torch::Tensor& mask, int connectivity) {
    torch::Tensor m = mask.to(torch::kCPU).to(torch::kBool).contiguous();
    const int64_t nd = m.dim();
    TORCH_CHECK(nd >= 1, "label_components: mask must have at least one dimension");
    TORCH_CHECK(connectivity >= 1 && connectivity <= nd,
        "label_components: connectivity must be in [1, ", nd, "], got ", connectivity);

    const std::vector<int64_t> shape = m.sizes().vec();
    const std::vector<int64_t> strides = c_strides(shape);
    const int64_t n = m.numel();
    const bool* data = m.data_ptr<bool>();

    // 只取中心之后的一半偏移，另一半由对称性覆盖
    const StencilTables& st = stencil_tables(static_cast<int>(nd));
    auto steps = st.steps.accessor<int64_t, 2>();
    std::vector<std::vector<int64_t>> offs;
    std::vector<int64_t> flat_offs;
    for (int64_t k = st.center + 1; k < st.steps.size(0); ++k) {
        int order = 0;
        int64_t flat = 0;
        std::vector<int64_t> o(nd);
        for (int64_t a = 0; a < nd; ++a) {
            o[a] = steps[k][a];
            order += o[a] != 0;
            flat += o[a] * strides[a];
        }
        if (order > connectivity) continue;
        offs.push_back(o);
        flat_offs.push_back(flat);
    }

    DisjointSet ds(n);
    std::vector<int64_t> coord(nd, 0);
    for (int64_t i = 0; i < n; ++i) {
        if (data[i]) {
            for (size_t j = 0; j < offs.size(); ++j) {
                bool inside = true;
                for (int64_t a = 0; a < nd; ++a) {
                    const int64_t c = coord[a] + offs[j][a];
                    if (c < 0 || c >= shape[a]) {
                        inside = false;
                        break;
                    }
                }
                if (inside && data[i + flat_offs[j]]) ds.unite(i, i + flat_offs[j]);
            }
        }
        for (int64_t a = nd - 1; a >= 0; --a) {
            if (++coord[a] < shape[a]) break;
            coord[a] = 0;
        }
    }

    torch::Tensor labels = torch::zeros(shape, torch::kInt64);
    int64_t* out = labels.data_ptr<int64_t>();
    std::vector<int64_t> root_label(n, 0);
    int64_t count = 0;
    for (int64_t i = 0; i < n; ++i) {
        if (!data[i]) continue;
        const int64_t r = ds.find(i);
        if (root_label[r] == 0) root_label[r] = ++count;
        out[i] = root_label[r];
    }
    return std::make_tuple(labels, count);
}

torch::Tensor hysteresis_threshold(const torch::Tensor& x, double low, double high) {
    torch::Tensor xc = x.to(torch::kCPU);
    torch::Tensor mask_low = xc > low;
    torch::Tensor mask_high = xc > high;

    torch::Tensor labels;
    int64_t count = 0;
    std::tie(labels, count) = label_components(mask_low, 1);

    torch::Tensor keep = torch::zeros({ count + 1 }, torch::kBool);
    keep.index_put_({ labels.masked_select(mask_high) }, true);
    keep[0].fill_(false);
    return keep.index({ labels });
}

// =================================================================================
// Density Clustering
// =================================================================================

torch::Tensor dbscan(const torch::Tensor& points, double eps, int64_t min_samples) {
    TORCH_CHECK(points.dim() == 2, "dbscan: points must be [Npts x D], got ", points.sizes());
    TORCH_CHECK(eps > 0, "dbscan: eps must be positive");

    torch::Tensor pts_t = points.to(torch::kCPU, torch::kFloat64).contiguous();
    const int64_t n = pts_t.size(0);
    const int64_t d = pts_t.size(1);
    torch::Tensor labels = torch::full({ n }, -1, torch::kInt64);
    if (n == 0) return labels;

    const double* pts = pts_t.data_ptr<double>();
    const double eps2 = eps * eps;
    ClusterGrid grid = build_grid(pts, n, d, eps);

    // 1. 核心点判定 (邻居计数含自身，达到 min_samples 即停止)
    std::vector<char> core(n, 0);
    for (int64_t i = 0; i < n; ++i) {
        const int64_t c = grid.cell_of[i];
        int64_t count = 0;
        for (int64_t nc : grid.neighbors[c]) {
            if (nc == c) {
                count += static_cast<int64_t>(grid.members[c].size());
            }
            else {
                for (int64_t j : grid.members[nc]) {
                    if (squared_distance(pts + i * d, pts + j * d, d) <= eps2) ++count;
                    if (count >= min_samples) break;
                }
            }
            if (count >= min_samples) break;
        }
        core[i] = count >= min_samples;
    }

    std::vector<std::vector<int64_t>> core_members(grid.members.size());
    for (size_t c = 0; c < grid.members.size(); ++c) {
        for (int64_t i : grid.members[c]) {
            if (core[i]) core_members[c].push_back(i);
        }
    }

    // 2. 合并核心点: 同格子直接合并，相邻格子存在一对距离 <= eps 的核心点即合并
    DisjointSet ds(n);
    for (size_t c = 0; c < core_members.size(); ++c) {
        const std::vector<int64_t>& cm = core_members[c];
        for (size_t k = 1; k < cm.size(); ++k) ds.unite(cm[0], cm[k]);
    }
    for (size_t c = 0; c < core_members.size(); ++c) {
        if (core_members[c].empty()) continue;
        for (int64_t nc : grid.neighbors[c]) {
            if (nc <= static_cast<int64_t>(c) || core_members[nc].empty()) continue;
            if (ds.find(core_members[c][0]) == ds.find(core_members[nc][0])) continue;
            bool linked = false;
            for (int64_t i : core_members[c]) {
                for (int64_t j : core_members[nc]) {
                    if (squared_distance(pts + i * d, pts + j * d, d) <= eps2) {
                        linked = true;
                        break;
                    }
                }
                if (linked) break;
            }
            if (linked) ds.unite(core_members[c][0], core_members[nc][0]);
        }
    }

    // 3. 边界点归入最近核心点所在的簇
    std::vector<int64_t> owner(n, -1);
    for (int64_t i = 0; i < n; ++i) {
        if (core[i]) {
            owner[i] = ds.find(i);
            continue;
        }
        double best = std::numeric_limits<double>::infinity();
        int64_t best_j = -1;
        for (int64_t nc : grid.neighbors[grid.cell_of[i]]) {
            for (int64_t j : core_members[nc]) {
                const double dd = squared_distance(pts + i * d, pts + j * d, d);
                if (dd > eps2) continue;
                if (dd < best || (dd == best && j < best_j)) {
                    best = dd;
                    best_j = j;
                }
            }
        }
        if (best_j >= 0) owner[i] = ds.find(best_j);
    }

    // 4. 按首次出现顺序编号
    int64_t* out = labels.data_ptr<int64_t>();
    std::unordered_map<int64_t, int64_t> cluster_id;
    for (int64_t i = 0; i < n; ++i) {
        if (owner[i] < 0) continue;
        auto it = cluster_id.find(owner[i]);
        if (it == cluster_id.end()) {
            it = cluster_id.emplace(owner[i], static_cast<int64_t>(cluster_id.size())).first;
        }
        out[i] = it->second;
    }
    return labels;
}

void snap_outliers(const torch::Tensor& points, torch::Tensor& labels, int k) {
    TORCH_CHECK(labels.scalar_type() == torch::kInt64 && labels.is_contiguous(),
        "snap_outliers: labels must be a contiguous int64 tensor");
    torch::Tensor noise = torch::nonzero(labels == -1).flatten();
    const int64_t n_out = noise.numel();
    const int64_t n = points.size(0);
    if (n_out == 0 || n_out == n) return;

    torch::Tensor pts = points.to(torch::kCPU, torch::kFloat32).contiguous();
    const int d = static_cast<int>(pts.size(1));

    // FLANN 索引引用 data 的内存，data 需在查询结束前保持有效
    cv::Mat data(static_cast<int>(n), d, CV_32F, pts.data_ptr<float>());
    cv::flann::Index index(data, cv::flann::KDTreeIndexParams(1));

    cv::Mat query(static_cast<int>(n_out), d, CV_32F);
    const int64_t* noise_idx = noise.data_ptr<int64_t>();
    for (int64_t r = 0; r < n_out; ++r) {
        data.row(static_cast<int>(noise_idx[r])).copyTo(query.row(static_cast<int>(r)));
    }

    const int knn = static_cast<int>(std::min<int64_t>(k, n));
    cv::Mat indices, dists;
    index.knnSearch(query, indices, dists, knn, cv::flann::SearchParams(-1));

    // 先收集全部结果再写回，避免已吸附的点影响后续噪声点
    int64_t* lab = labels.data_ptr<int64_t>();
    std::vector<int64_t> snapped(n_out, -1);
    for (int64_t r = 0; r < n_out; ++r) {
        const int* row = indices.ptr<int>(static_cast<int>(r));
        for (int j = 0; j < knn; ++j) {
            if (row[j] < 0 || row[j] >= n) continue;
            if (lab[row[j]] != -1) {
                snapped[r] = lab[row[j]];
                break;
            }
        }
    }
    for (int64_t r = 0; r < n_out; ++r) lab[noise_idx[r]] = snapped[r];
}

// =================================================================================
// Mask Reconstruction
// =================================================================================

torch::Tensor get_masks(const torch::Tensor& p, const torch::Tensor& bd, const torch::Tensor& dist,
    const torch::Tensor& mask, const torch::Tensor& inds, int nclasses, bool cluster,
    double diam_threshold, bool verbose) {
    torch::Tensor fg = mask.to(torch::kCPU).to(torch::kBool);
    const int64_t nd = fg.dim();
    TORCH_CHECK(p.dim() == 2 && p.size(0) == nd, "get_masks: p must be [", nd, " x Npts], got ", p.sizes());
    TORCH_CHECK(inds.dim() == 2 && inds.size(0) == p.size(1) && inds.size(1) == nd,
        "get_masks: inds ", inds.sizes(), " do not match p ", p.sizes());

    // 1. 估计平均直径并确定聚类半径
    double diam = 0.0;
    double eps = 0.0;
    if (nclasses >= 4) {
        torch::Tensor dt = dist.to(torch::kCPU, torch::kFloat32).masked_select(fg).abs();
        diam = dist_to_diam(dt, nd);
        eps = 1.0 + 1.0 / 3.0;
    }
    else {
        diam = diameters(fg.to(torch::kInt64));
        eps = std::sqrt(2.0);
    }
    if (verbose) LOG(INFO) << "Mean diameter is " << diam;

    if (diam <= diam_threshold) {
        cluster = true;
        if (verbose) LOG(INFO) << "Turning on subpixel clustering for label continuity.";
    }

    torch::Tensor labels = torch::zeros(fg.sizes(), torch::kInt64);
    if (inds.size(0) == 0) return labels;

    torch::Tensor strides = torch::tensor(c_strides(fg.sizes()), torch::kInt64);
    torch::Tensor cell_px = (inds.to(torch::kCPU, torch::kInt64) * strides).sum(1);
    torch::Tensor newinds = p.to(torch::kCPU, torch::kFloat32).t().contiguous();  // [Npts x D]

    if (cluster) {
        // 2a. 亚像素坐标上的密度聚类
        if (verbose) LOG(INFO) << "Doing DBSCAN clustering with eps=" << eps;
        torch::Tensor db = dbscan(newinds, eps, 3);
        snap_outliers(newinds, db, 50);
        labels.view({ -1 }).index_put_({ cell_px }, db + 1);
        return labels;
    }

    // 2b. 骨架连通域: 收敛位置取整后标记骨架
    torch::Tensor upper = torch::tensor(fg.sizes().vec(), torch::kInt64) - 1;
    torch::Tensor rounded = torch::minimum(newinds.round().to(torch::kInt64).clamp_min(0), upper);
    torch::Tensor new_px = (rounded * strides).sum(1);
    torch::Tensor skel = torch::zeros({ fg.numel() }, torch::kBool);
    skel.index_put_({ new_px }, true);
    skel = skel.view(fg.sizes());

    // 距图像边缘 5 个像素以内断开粘连的骨架
    torch::Tensor frame = border_frame(fg.sizes(), 5);
    torch::Tensor border_px = skel.logical_and(frame);
    if (nclasses == 4 && bd.defined()) {
        border_px = border_px.logical_and(bd.to(torch::kCPU).gt(-1).logical_not());
        if (verbose) LOG(INFO) << "Using boundary output to split edge defects";
    }
    else {
        if (verbose && bd.defined()) {
            LOG(INFO) << "Boundary output ignored for nclasses=" << nclasses << ", opening edge skeleton instead";
        }
        border_px = binary_opening(border_px, 3);
    }
    skel = torch::where(frame, border_px, skel);

    torch::Tensor LL = std::get<0>(label_components(skel, static_cast<int>(nd)));
    labels.view({ -1 }).index_put_({ cell_px }, LL.view({ -1 }).index({ new_px }));
    return labels;
}

// =================================================================================
// Histogram Seeding
// =================================================================================

torch::Tensor max_pool_nd(const torch::Tensor& input, int kernel_size) {
    namespace F = torch::nn::functional;
    TORCH_CHECK(kernel_size >= 1 && kernel_size % 2 == 1, "max_pool_nd: kernel_size must be odd, got ", kernel_size);
    torch::Tensor out = input.to(torch::kFloat32);
    if (out.numel() == 0 || kernel_size == 1) return out;

    // 可分离: 逐轴做一维最大值滤波，窗口外不参与比较
    auto options = F::MaxPool1dFuncOptions(kernel_size).stride(1).padding(kernel_size / 2);
    for (int64_t a = 0; a < out.dim(); ++a) {
        torch::Tensor moved = out.movedim(a, -1).contiguous();
        const std::vector<int64_t> moved_shape = moved.sizes().vec();
        torch::Tensor pooled = F::max_pool1d(moved.view({ -1, 1, moved.size(-1) }), options);
        out = pooled.view(moved_shape).movedim(-1, a).contiguous();
    }
    return out;
}

torch::Tensor remove_large_masks_and_renumber(const torch::Tensor& labels, double max_size_fraction) {
    torch::Tensor m = renumber(labels.to(torch::kCPU));
    if (m.numel() == 0) return m;

    const int64_t K = m.max().item<int64_t>();
    torch::Tensor counts = torch::bincount(m.flatten(), {}, K + 1);
    torch::Tensor large = counts.to(torch::kFloat64) > static_cast<double>(m.numel()) * max_size_fraction;
    large[0].fill_(false);
    return renumber(m.masked_fill(large.index({ m }), 0));
}

torch::Tensor get_masks_histogram(const torch::Tensor& p, const torch::Tensor& inds, at::IntArrayRef shape,
    int rpad, double max_size_fraction) {
    const int64_t nd = static_cast<int64_t>(shape.size());
    TORCH_CHECK(p.dim() == 2 && p.size(0) == nd, "get_masks_histogram: p must be [", nd, " x Npts], got ", p.sizes());
    TORCH_CHECK(inds.dim() == 2 && inds.size(0) == p.size(1) && inds.size(1) == nd,
        "get_masks_histogram: inds ", inds.sizes(), " do not match p ", p.sizes());
    TORCH_CHECK(rpad >= 0, "get_masks_histogram: rpad must be non-negative");

    torch::Tensor labels = torch::zeros(shape, torch::kInt64);
    if (inds.size(0) == 0) return labels;

    // 1. 收敛位置取整并平移 rpad，扩展网格之外的点不参与统计
    std::vector<int64_t> padded(nd);
    int64_t total = 1;
    for (int64_t a = 0; a < nd; ++a) {
        padded[a] = shape[a] + 2 * rpad;
        total *= padded[a];
    }
    torch::Tensor pstrides = torch::tensor(c_strides(padded), torch::kInt64);
    torch::Tensor pupper = torch::tensor(padded, torch::kInt64);

    torch::Tensor pos = p.to(torch::kCPU, torch::kFloat32).t();  // [Npts x D]
    torch::Tensor finite = torch::isfinite(pos).all(1);
    torch::Tensor pint = torch::nan_to_num(pos, 0.0, 0.0, 0.0).floor().to(torch::kInt64) + rpad;
    torch::Tensor valid = finite.logical_and((pint >= 0).all(1)).logical_and((pint < pupper).all(1));
    torch::Tensor pflat = (pint * pstrides).sum(1).masked_fill(valid.logical_not(), 0);

    // 2. 收敛点直方图
    torch::Tensor h = torch::bincount(pflat.masked_select(valid), {}, total);
    torch::Tensor hmax = max_pool_nd(h.view(padded), 5).flatten();

    // 3. 局部极大且计数 > 10 的格子为种子，按计数降序处理
    torch::Tensor hf = h.to(torch::kFloat32);
    torch::Tensor seeds = torch::nonzero((hf - hmax > -1e-6).logical_and(h > 10)).flatten();
    if (seeds.numel() == 0) return labels;
    torch::Tensor order = std::get<1>(h.index({ seeds }).sort(/*stable=*/true, /*dim=*/0, /*descending=*/true));
    seeds = seeds.index({ order });

    // 4. 每个种子向 3^D 邻域中计数 > 2 的格子扩展 5 次，后处理的种子覆盖先处理的
    const StencilTables& st = stencil_tables(static_cast<int>(nd));
    torch::Tensor M = torch::zeros({ total }, torch::kInt64);
    const int64_t nseeds = seeds.size(0);
    for (int64_t k = 0; k < nseeds; ++k) {
        torch::Tensor pix = seeds.narrow(0, k, 1);
        for (int iter = 0; iter < 5; ++iter) {
            torch::Tensor coords = pix.unsqueeze(1).div(pstrides, "floor").remainder(pupper);  // [n x D]
            torch::Tensor nb = (coords.unsqueeze(1) + st.steps.unsqueeze(0)).reshape({ -1, nd });
            torch::Tensor inside = (nb >= 0).all(1).logical_and((nb < pupper).all(1));
            torch::Tensor nflat = (nb.index({ inside }) * pstrides).sum(1);
            nflat = std::get<0>(torch::_unique(nflat, /*sorted=*/true, /*return_inverse=*/false));
            pix = nflat.masked_select(h.index({ nflat }) > 2);
        }
        M.index_put_({ pix }, k + 1);
    }

    // 5. 像素取其收敛格子的编号
    torch::Tensor M0 = M.index({ pflat }).masked_fill(valid.logical_not(), 0);
    torch::Tensor strides = torch::tensor(c_strides(shape), torch::kInt64);
    torch::Tensor cell_px = (inds.to(torch::kCPU, torch::kInt64) * strides).sum(1);
    labels.view({ -1 }).index_put_({ cell_px }, M0);

    // 6. 去除过大掩膜并重编号
    return remove_large_masks_and_renumber(labels, max_size_fraction);
}
