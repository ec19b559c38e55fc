#include <gtest/gtest.h>
#include "Cellflow_core.h"
#include "Flows.h"
#include "Tensor_utils.h"
#include "test_helpers.h"

namespace {

    // 由标签生成理想的网络输出: 平滑距离场 (背景 -5) 与 5 倍流场
    struct NetOutput {
        torch::Tensor dist;
        torch::Tensor dP;
    };

    NetOutput ideal_output(const torch::Tensor& labels) {
        torch::Tensor target = training_target(labels);
        NetOutput out;
        out.dist = target[3].contiguous();
        out.dP = target.narrow(0, 5, labels.dim()).contiguous();
        return out;
    }
}

// ---- empty input ------------------------------------------------------------

TEST(ComputeMasks, NoForeground)
{
    torch::Tensor dist = torch::zeros({ 50, 50 });
    torch::Tensor dP = torch::zeros({ 2, 50, 50 });
    MaskParams params;
    params.calc_trace = true;
    MaskResult res = compute_masks(dP, dist, {}, {}, {}, params);

    EXPECT_EQ(res.masks.sizes(), torch::IntArrayRef({ 50, 50 }));
    EXPECT_FALSE(res.masks.any().item<bool>());
    EXPECT_EQ(res.p.sizes(), torch::IntArrayRef({ 2, 0 }));
    EXPECT_FALSE(res.trace.defined());
}

TEST(ComputeMasks, NoForegroundWithResize)
{
    MaskParams params;
    params.resize = { 100, 120 };
    MaskResult res = compute_masks(torch::zeros({ 2, 50, 50 }), torch::full({ 50, 50 }, -5.0f), {}, {}, {}, params);
    EXPECT_EQ(res.masks.sizes(), torch::IntArrayRef({ 100, 120 }));
    EXPECT_FALSE(res.masks.any().item<bool>());
}

TEST(ComputeMasks, ShapeMismatchThrows)
{
    EXPECT_THROW(compute_masks(torch::zeros({ 2, 10, 11 }), torch::zeros({ 10, 10 })), c10::Error);
    EXPECT_THROW(compute_masks(torch::zeros({ 3, 10, 10 }), torch::zeros({ 10, 10 })), c10::Error);
}

// ---- reconstruction ---------------------------------------------------------

TEST(ComputeMasks, SingleSquare)
{
    torch::Tensor labels = square_labels(32, 10, 22);
    NetOutput net = ideal_output(labels);
    MaskResult res = compute_masks(net.dP, net.dist);

    EXPECT_EQ(res.masks.max().item<int64_t>(), 1);
    const int64_t overlap = pixel_count(res.masks.eq(1).logical_and(labels.eq(1)));
    EXPECT_GE(overlap, 137);  // 144 像素的 95%
    EXPECT_EQ(res.p.size(0), 2);
    EXPECT_EQ(res.p.size(1), 144);
}

TEST(ComputeMasks, TwoSquaresAreSeparated)
{
    torch::Tensor labels = torch::zeros({ 32, 40 }, torch::kInt64);
    paint_box(labels, 10, 22, 6, 18, 1);
    paint_box(labels, 10, 22, 20, 32, 2);
    NetOutput net = ideal_output(labels);
    MaskResult res = compute_masks(net.dP, net.dist);

    EXPECT_EQ(res.masks.max().item<int64_t>(), 2);
    const int64_t a = res.masks[16][10].item<int64_t>();
    const int64_t b = res.masks[16][26].item<int64_t>();
    EXPECT_GT(a, 0);
    EXPECT_GT(b, 0);
    EXPECT_NE(a, b);
}

TEST(ComputeMasks, OnePixelGapRecoversTwo)
{
    torch::Tensor labels = torch::zeros({ 24, 34 }, torch::kInt64);
    paint_box(labels, 7, 17, 6, 16, 1);
    paint_box(labels, 7, 17, 17, 27, 2);
    NetOutput net = ideal_output(labels);
    MaskResult res = compute_masks(net.dP, net.dist);

    EXPECT_EQ(res.masks.max().item<int64_t>(), 2);
    const int64_t a = res.masks[12][10].item<int64_t>();
    const int64_t b = res.masks[12][21].item<int64_t>();
    EXPECT_GT(a, 0);
    EXPECT_GT(b, 0);
    EXPECT_NE(a, b);
    EXPECT_FALSE(res.masks.select(1, 16).any().item<bool>());
}

TEST(ComputeMasks, HistogramSeedingWithoutOmni)
{
    torch::Tensor labels = square_labels(32, 10, 22);
    FlowResult heat = masks_to_flows(labels, {}, FlowMode::Heat);
    torch::Tensor dP = 5.0 * heat.flow;
    torch::Tensor dist = torch::where(labels > 0, torch::ones({ 32, 32 }), torch::full({ 32, 32 }, -5.0f));

    // 全部像素收敛到同一点
    torch::Tensor p = torch::full({ 2, 144 }, 16.0f);
    MaskParams params;
    params.omni = false;
    MaskResult res = compute_masks(dP, dist, {}, p, {}, params);

    EXPECT_EQ(res.masks.max().item<int64_t>(), 1);
    EXPECT_TRUE(torch::equal(res.masks, labels));
}

TEST(ComputeMasks, BoundaryIgnoredBelowFourClasses)
{
    torch::Tensor labels = square_labels(32, 10, 22);
    NetOutput net = ideal_output(labels);
    MaskParams params;
    params.verbose = true;
    MaskResult plain = compute_masks(net.dP, net.dist, {}, {}, {}, params);
    MaskResult with_bd = compute_masks(net.dP, net.dist, torch::ones({ 32, 32 }), {}, {}, params);
    EXPECT_TRUE(torch::equal(plain.masks, with_bd.masks));
}

TEST(ComputeMasks, TraceRequested)
{
    torch::Tensor labels = square_labels(32, 10, 22);
    NetOutput net = ideal_output(labels);
    MaskParams params;
    params.calc_trace = true;
    params.niter = 30;
    MaskResult res = compute_masks(net.dP, net.dist, {}, {}, {}, params);
    ASSERT_TRUE(res.trace.defined());
    EXPECT_EQ(res.trace.sizes(), torch::IntArrayRef({ 31, 2, 144 }));
}

TEST(ComputeMasks, SuppliedPositions)
{
    torch::Tensor labels = square_labels(32, 10, 22);
    NetOutput net = ideal_output(labels);
    MaskResult first = compute_masks(net.dP, net.dist);
    MaskResult second = compute_masks(net.dP, net.dist, {}, first.p);
    EXPECT_TRUE(torch::equal(first.masks, second.masks));

    EXPECT_THROW(compute_masks(net.dP, net.dist, {}, first.p.narrow(1, 0, 10)), c10::Error);
}

TEST(ComputeMasks, ResizedOutput)
{
    torch::Tensor labels = square_labels(32, 10, 22);
    NetOutput net = ideal_output(labels);
    MaskParams params;
    params.resize = { 64, 64 };
    MaskResult res = compute_masks(net.dP, net.dist, {}, {}, {}, params);
    EXPECT_EQ(res.masks.sizes(), torch::IntArrayRef({ 64, 64 }));
    EXPECT_EQ(res.masks.max().item<int64_t>(), 1);
}

TEST(ComputeMasks, MatOverload)
{
    torch::Tensor labels = square_labels(32, 10, 22);
    NetOutput net = ideal_output(labels);
    cv::Mat dP = tensor_to_mat(net.dP);
    cv::Mat dist = tensor_to_mat(net.dist);
    ASSERT_EQ(dP.type(), CV_32FC2);

    cv::Mat masks = compute_masks(dP, dist, cv::Mat());
    EXPECT_EQ(masks.type(), CV_32SC1);
    EXPECT_EQ(masks.rows, 32);
    double max_label = 0.0;
    cv::minMaxLoc(masks, nullptr, &max_label);
    EXPECT_EQ(max_label, 1.0);
}

// ---- training targets -------------------------------------------------------

TEST(TrainingTarget, Channels)
{
    torch::Tensor labels = square_labels(24, 6, 16);
    torch::Tensor target = training_target(labels, 5.0);

    ASSERT_EQ(target.sizes(), torch::IntArrayRef({ 7, 24, 24 }));
    EXPECT_EQ(target.scalar_type(), torch::kFloat32);
    torch::Tensor fg = labels > 0;
    EXPECT_TRUE(torch::equal(target[1], fg.to(torch::kFloat32)));
    EXPECT_EQ(target[2][6][10].item<float>(), 1.0f);
    EXPECT_EQ(target[2][10][10].item<float>(), 0.0f);

    torch::Tensor dist = target[3];
    EXPECT_TRUE(torch::all(dist.masked_select(fg.logical_not()) == -5.0f).item<bool>());
    EXPECT_GT(dist.masked_select(fg).min().item<float>(), 0.0f);

    EXPECT_GE(target[4].min().item<float>(), 0.5f);
    EXPECT_GT(target[4][5][10].item<float>(), target[4][20][20].item<float>());

    torch::Tensor flow = target.narrow(0, 5, 2);
    EXPECT_EQ(flow.abs().sum(0).masked_select(fg.logical_not()).max().item<float>(), 0.0f);
    EXPECT_NEAR(flow.pow(2).sum(0).sqrt().max().item<float>(), 5.0f, 1e-4);
}

TEST(TrainingTarget, LabelFillingWholeImage)
{
    torch::Tensor labels = torch::ones({ 8, 8 }, torch::kInt64);
    torch::Tensor target;
    ASSERT_NO_THROW(target = training_target(labels));
    ASSERT_EQ(target.sizes(), torch::IntArrayRef({ 7, 8, 8 }));
    EXPECT_TRUE(torch::isfinite(target).all().item<bool>());
    EXPECT_GT(target[3].min().item<float>(), 0.0f);
}

TEST(LabelsToFlows, SliceWise3D)
{
    torch::Tensor labels = torch::zeros({ 6, 8, 8 }, torch::kInt64);
    using torch::indexing::Slice;
    labels.index_put_({ Slice(1, 5), Slice(2, 6), Slice(2, 6) }, 1);
    torch::Tensor out = labels_to_flows(labels, FlowMode::Eikonal, torch::kCPU, 2);
    ASSERT_EQ(out.sizes(), torch::IntArrayRef({ 6, 6, 8, 8 }));
    EXPECT_GT(out[2][1][3][3].item<float>(), 0.0f);
    EXPECT_FALSE(out[5].any().item<bool>());
}

TEST(TrainingTarget, RequiresForeground)
{
    EXPECT_THROW(training_target(torch::zeros({ 8, 8 }, torch::kInt64)), c10::Error);
}

TEST(LabelsToFlows, Channels)
{
    torch::Tensor labels = square_labels(20, 5, 15);
    torch::Tensor out = labels_to_flows(labels);
    ASSERT_EQ(out.sizes(), torch::IntArrayRef({ 5, 20, 20 }));
    EXPECT_TRUE(torch::equal(out[0], labels.to(torch::kFloat32)));
    EXPECT_FLOAT_EQ(out[1][9][9].item<float>(), 5.0f);
    EXPECT_GT(out[3][9][5].item<float>(), 0.0f);
    EXPECT_GT(out[4][9][9].item<float>(), out[4][9][5].item<float>());
}
