#include "Flows.h"
#include "Distance.h"
#include "Stencil.h"
#include "Tensor_utils.h"
#include <c10/util/Logging.h>
#include <algorithm>
#include <cmath>
#include <tuple>
#include <vector>

using torch::indexing::Slice;

// =================================================================================
// Internal Helper Functions
// =================================================================================

namespace {

    // 前景像素的邻域索引
    struct Neighborhood {
        torch::Tensor coords;      // [Npix x D] 填充后坐标
        torch::Tensor neigh_idx;   // [Npix x 3^D] 邻居展平下标
        torch::Tensor isneigh;     // [Npix x 3^D] 邻居是否属于同一实例
        torch::Tensor center_idx;  // [Npix] 中心像素展平下标
    };

    Neighborhood gather_neighborhood(const torch::Tensor& masks_padded, const StencilTables& st) {
        Neighborhood nb;
        torch::Tensor strides = torch::tensor(c_strides(masks_padded.sizes()), torch::kInt64);

        nb.coords = torch::nonzero(masks_padded);
        torch::Tensor neighbors = nb.coords.unsqueeze(1) + st.steps.unsqueeze(0);  // [Npix x 3^D x D]
        nb.neigh_idx = (neighbors * strides).sum(-1);

        torch::Tensor neighbor_masks = masks_padded.flatten().index({ nb.neigh_idx });
        nb.isneigh = neighbor_masks == neighbor_masks.select(1, st.center).unsqueeze(1);
        nb.center_idx = nb.neigh_idx.select(1, st.center).contiguous();
        return nb;
    }

    // 点源位置: 质心在实例内则取质心，否则取距离坐标中位数最近的实例像素 (扫描顺序第一个)
    // 同时返回 Heat 模式的默认迭代次数 2*max(sum(extent+1))
    std::tuple<torch::Tensor, int64_t> find_seeds(const torch::Tensor& masks_padded, const Neighborhood& nb) {
        torch::Tensor flat_labels = masks_padded.flatten();
        torch::Tensor strides = torch::tensor(c_strides(masks_padded.sizes()), torch::kInt64);
        torch::Tensor lab = flat_labels.index({ nb.center_idx });

        const int64_t K = lab.max().item<int64_t>();
        torch::Tensor order = std::get<1>(lab.sort(/*stable=*/true, /*dim=*/0, /*descending=*/false));
        torch::Tensor coords = nb.coords.index({ order });
        torch::Tensor counts = torch::bincount(lab, {}, K + 1);

        std::vector<int64_t> seeds;
        seeds.reserve(K);
        int64_t max_ext = 0;
        int64_t offset = counts[0].item<int64_t>();
        for (int64_t k = 1; k <= K; ++k) {
            const int64_t n = counts[k].item<int64_t>();
            if (n == 0) continue;
            torch::Tensor c = coords.narrow(0, offset, n);
            offset += n;

            torch::Tensor ext = std::get<0>(c.max(0)) - std::get<0>(c.min(0)) + 2;
            max_ext = std::max(max_ext, ext.sum().item<int64_t>());

            torch::Tensor centroid = c.to(torch::kFloat64).mean(0).to(torch::kInt64);
            int64_t idx = (centroid * strides).sum().item<int64_t>();
            if (flat_labels[idx].item<int64_t>() != k) {
                torch::Tensor cf = c.to(torch::kFloat64);
                torch::Tensor med = torch::quantile(cf, 0.5, /*dim=*/0);
                const int64_t imin = (cf - med).pow(2).sum(1).argmin().item<int64_t>();
                idx = (c[imin] * strides).sum().item<int64_t>();
            }
            seeds.push_back(idx);
        }
        return std::make_tuple(torch::tensor(seeds, torch::kInt64), 2 * max_ext);
    }

    // 一组 m-face 对称邻居对的二次更新
    // a: [npairs x Npix] 各对的最小值，f: 该组权重 sqrt(m)
    torch::Tensor eikonal_group_update(const torch::Tensor& pair_mins, double f) {
        torch::Tensor a = std::get<0>(pair_mins.sort(0));
        torch::Tensor sum_a = torch::cumsum(a, 0);
        torch::Tensor sum_a2 = torch::cumsum(a * a, 0);
        torch::Tensor count = torch::arange(1, a.size(0) + 1, a.options()).unsqueeze(1);
        torch::Tensor radicand = sum_a * sum_a - count * (sum_a2 - f * f);

        // 排序后可行的 d 构成前缀，取最大的可行 d
        torch::Tensor nvalid = (radicand >= 0).sum(0);
        torch::Tensor sel = (nvalid - 1).clamp_min(0).unsqueeze(0);
        torch::Tensor ad = sum_a.gather(0, sel).squeeze(0);
        torch::Tensor rd = radicand.gather(0, sel).squeeze(0);
        torch::Tensor phi = (ad + rd.clamp_min(0).sqrt()) / nvalid.to(a.scalar_type()).clamp_min(1);

        // 根号下为负的组不参与本次乘积
        torch::Tensor ok = (nvalid > 0).logical_and(rd >= 0);
        return torch::where(ok, phi, torch::ones_like(phi));
    }

    torch::Tensor eikonal_update(const torch::Tensor& T, const Neighborhood& nb, const StencilTables& st) {
        torch::Tensor Tneigh = T.index({ nb.neigh_idx }) * nb.isneigh;
        torch::Tensor phi_total = torch::ones({ Tneigh.size(0) }, T.options());

        for (int f = 1; f <= st.dim; ++f) {
            const std::vector<int64_t>& inds = st.groups[f];
            const size_t npairs = inds.size() / 2;
            std::vector<torch::Tensor> mins;
            mins.reserve(npairs);
            for (size_t i = 0; i < npairs; ++i) {
                mins.push_back(torch::minimum(Tneigh.select(1, inds[i]), Tneigh.select(1, inds[inds.size() - 1 - i])));
            }
            phi_total = phi_total * eikonal_group_update(torch::stack(mins), st.factors[f]);
        }
        // 各连通组的几何平均
        return phi_total.pow(1.0 / st.dim);
    }
}

// =================================================================================
// Field Solver
// =================================================================================

torch::Tensor normalize_field(const torch::Tensor& mu) {
    torch::Tensor mag = torch::nansum(mu * mu, 0).sqrt();
    torch::Tensor valid = (mag > 0).logical_and(torch::isfinite(mag));
    torch::Tensor safe = torch::where(valid, mag, torch::ones_like(mag));
    return torch::where(valid.unsqueeze(0), mu / safe.unsqueeze(0), torch::zeros_like(mu));
}

FlowResult solve_fields(const torch::Tensor& labels, const torch::Tensor& dists,
    FlowMode mode, torch::Device device, int64_t n_iter) {
    const int64_t d = labels.dim();
    TORCH_CHECK(d >= 1, "solve_fields: labels must have at least one dimension");

    FlowResult res;
    torch::Tensor masks = renumber(labels.to(torch::kCPU));
    res.labels = masks;
    res.dist = dists.defined() ? dists.to(torch::kCPU).to(torch::kFloat32) : torch::Tensor();

    std::vector<int64_t> flow_shape = { d };
    for (int64_t s : masks.sizes()) flow_shape.push_back(s);

    if (!masks.gt(0).any().item<bool>()) {
        res.flow = torch::zeros(flow_shape, torch::kFloat32);
        res.potential = torch::zeros(masks.sizes(), torch::kFloat64);
        return res;
    }

    // 以 0 填充一个像素，边缘像素无需特殊处理
    const int64_t pad = 1;
    torch::Tensor masks_padded = pad_zero(masks, pad, d);
    const StencilTables& st = stencil_tables(static_cast<int>(d));
    Neighborhood nb = gather_neighborhood(masks_padded, st);

    torch::Tensor seeds;
    if (mode == FlowMode::Heat) {
        int64_t heat_iter = 0;
        std::tie(seeds, heat_iter) = find_seeds(masks_padded, nb);
        if (n_iter <= 0) n_iter = heat_iter;
        seeds = seeds.to(device);
    }
    else if (n_iter <= 0) {
        // 单个实例铺满整幅图像时距离场为无穷，改用图像外部为背景的距离
        torch::Tensor ref = res.dist.defined() ? res.dist : edt(masks);
        if (!torch::isfinite(ref).all().item<bool>()) ref = edt(masks, true);
        n_iter = get_niter(ref);
    }

    torch::Tensor neigh_idx = nb.neigh_idx.to(device);
    torch::Tensor center_idx = nb.center_idx.to(device);
    nb.neigh_idx = neigh_idx;
    nb.center_idx = center_idx;
    nb.isneigh = nb.isneigh.to(device);

    torch::Tensor T = torch::zeros({ masks_padded.numel() }, torch::dtype(torch::kFloat64).device(device));
    for (int64_t t = 0; t < n_iter; ++t) {
        if (mode == FlowMode::Eikonal) {
            T.index_put_({ center_idx }, eikonal_update(T, nb, st));
        }
        else {
            T.index_put_({ seeds }, T.index({ seeds }) + 1);
            torch::Tensor Tneigh = T.index({ neigh_idx }) * nb.isneigh;
            T.index_put_({ center_idx }, Tneigh.mean(1));
        }
    }
    if (mode == FlowMode::Heat) T = torch::log1p(T);

    // 仅在同一实例的邻居之间做中心差分，避免梯度渗到相邻实例
    const std::vector<int64_t>& card = st.groups[1];
    torch::Tensor card_t = torch::tensor(card, torch::dtype(torch::kInt64).device(device));
    torch::Tensor grads = T.index({ neigh_idx.index_select(1, card_t) }) * nb.isneigh.index_select(1, card_t);
    std::vector<torch::Tensor> comps;
    for (int64_t i = 0; i < d; ++i) {
        const int64_t lo = i;
        const int64_t hi = static_cast<int64_t>(card.size()) - 1 - i;
        comps.push_back((grads.select(1, hi) - grads.select(1, lo)) / 2.0);
    }
    torch::Tensor mu = normalize_field(torch::stack(comps));

    std::vector<int64_t> padded_flow_shape = { d };
    for (int64_t s : masks_padded.sizes()) padded_flow_shape.push_back(s);
    torch::Tensor flow = torch::zeros({ d, masks_padded.numel() }, torch::dtype(torch::kFloat32).device(device));
    flow.index_put_({ Slice(), center_idx }, mu.to(torch::kFloat32));

    res.flow = unpad(flow.view(padded_flow_shape), pad, d).contiguous().to(torch::kCPU);
    res.potential = unpad(T.view(masks_padded.sizes()), pad, d).contiguous().to(torch::kCPU);
    return res;
}

FlowResult masks_to_flows(const torch::Tensor& labels, const torch::Tensor& dists,
    FlowMode mode, torch::Device device, int dim) {
    const int64_t d = labels.dim();
    torch::Tensor masks = renumber(labels.to(torch::kCPU));
    torch::Tensor dist = dists.defined() ? dists.to(torch::kCPU).to(torch::kFloat32) : edt(masks);

    if (d == 3 && dim == 2) {
        return masks_to_flows_slices(masks, dist, mode, device);
    }

    if (!masks.gt(0).any().item<bool>() || mode == FlowMode::Heat) {
        // 点源模型不做镜像填充
        FlowResult res = solve_fields(masks, dist, mode, device);
        res.dist = dist;
        return res;
    }

    // 按平均直径镜像填充，延长贴边细胞的骨架
    const double diam = diameters(masks);
    if (!std::isfinite(diam)) {
        LOG(WARNING) << "masks_to_flows: a label fills the whole image, solving without reflect padding";
        FlowResult res = solve_fields(masks, dist, mode, device);
        res.dist = dist;
        return res;
    }
    const int64_t pad = static_cast<int64_t>(diam);
    torch::Tensor masks_pad = pad_reflect(masks, pad, d);
    torch::Tensor dists_pad = pad_reflect(dist, pad, d);
    FlowResult inner = solve_fields(masks_pad, dists_pad, mode, device);

    FlowResult res;
    res.labels = masks;
    res.dist = dist;
    res.potential = unpad(inner.potential, pad, d).contiguous();
    res.flow = unpad(inner.flow, pad, d).contiguous();
    return res;
}

// =================================================================================
// 3D Slice-wise Flows
// =================================================================================

FlowResult masks_to_flows_slices(const torch::Tensor& labels, const torch::Tensor& dists,
    FlowMode mode, torch::Device device) {
    TORCH_CHECK(labels.dim() == 3, "masks_to_flows_slices: expected a 3D label volume, got ", labels.dim(), "D");
    torch::Tensor masks = renumber(labels.to(torch::kCPU));
    torch::Tensor dist = dists.defined() ? dists.to(torch::kCPU).to(torch::kFloat32) : edt(masks);
    const int64_t Lz = masks.size(0), Ly = masks.size(1), Lx = masks.size(2);

    // 三个方向的 2D 切片流场累加到对应分量上
    torch::Tensor mu = torch::zeros({ 3, Lz, Ly, Lx }, torch::kFloat32);
    for (int64_t z = 0; z < Lz; ++z) {
        torch::Tensor f = solve_fields(masks.select(0, z), dist.select(0, z), mode, device).flow;
        mu[1].select(0, z).add_(f[0]);
        mu[2].select(0, z).add_(f[1]);
    }
    for (int64_t y = 0; y < Ly; ++y) {
        torch::Tensor f = solve_fields(masks.select(1, y), dist.select(1, y), mode, device).flow;
        mu[0].select(1, y).add_(f[0]);
        mu[2].select(1, y).add_(f[1]);
    }
    for (int64_t x = 0; x < Lx; ++x) {
        torch::Tensor f = solve_fields(masks.select(2, x), dist.select(2, x), mode, device).flow;
        mu[0].select(2, x).add_(f[0]);
        mu[1].select(2, x).add_(f[1]);
    }

    FlowResult res;
    res.labels = masks;
    res.dist = dist;
    res.potential = torch::zeros(masks.sizes(), torch::kFloat64);
    res.flow = mu;
    return res;
}

torch::Tensor smooth_distance(const torch::Tensor& labels, const torch::Tensor& dists, torch::Device device) {
    torch::Tensor dist = dists.defined() ? dists : edt(labels);
    return solve_fields(labels, dist, FlowMode::Eikonal, device).potential;
}
