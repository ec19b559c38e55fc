#include <gtest/gtest.h>
#include "Dynamics.h"
#include "test_helpers.h"

namespace {

    // 指向 center 的单位流场，center 处为 0
    torch::Tensor radial_field(int64_t size, double center) {
        torch::Tensor r = torch::arange(size, torch::kFloat32);
        std::vector<torch::Tensor> grid = torch::meshgrid({ r, r }, "ij");
        torch::Tensor dy = center - grid[0];
        torch::Tensor dx = center - grid[1];
        torch::Tensor mag = (dy * dy + dx * dx).sqrt().clamp_min(1e-6);
        return torch::stack({ dy / mag, dx / mag });
    }

    double mean_distance(const torch::Tensor& p, double center) {
        return (p - center).pow(2).sum(0).sqrt().mean().item<double>();
    }

    torch::Tensor constant_x_field(int64_t h, int64_t w) {
        return torch::stack({ torch::zeros({ h, w }), torch::ones({ h, w }) });
    }
}

// ---- follow_flows -----------------------------------------------------------

TEST(FollowFlows, RadialFieldConvergesInterp)
{
    torch::Tensor dP = radial_field(21, 10.0);
    torch::Tensor mask = torch::ones({ 21, 21 }, torch::kBool);
    AdvectResult res = follow_flows(dP, mask, {}, 200, true);

    const double before = mean_distance(res.inds.t().to(torch::kFloat32), 10.0);
    const double after = mean_distance(res.p, 10.0);
    EXPECT_LT(after, 0.5 * before);
}

TEST(FollowFlows, RadialFieldConvergesNearest)
{
    torch::Tensor dP = radial_field(21, 10.0);
    torch::Tensor mask = torch::ones({ 21, 21 }, torch::kBool);
    AdvectResult res = follow_flows(dP, mask, {}, 200, false);

    const double before = mean_distance(res.inds.t().to(torch::kFloat32), 10.0);
    const double after = mean_distance(res.p, 10.0);
    EXPECT_LT(after, 0.5 * before);
}

TEST(FollowFlows, ConstantFieldIsClampedToImage)
{
    torch::Tensor dP = constant_x_field(10, 10);
    torch::Tensor mask = torch::ones({ 10, 10 }, torch::kBool);
    for (bool interp : { true, false }) {
        AdvectResult res = follow_flows(dP, mask, {}, 200, interp);
        ASSERT_EQ(res.p.sizes(), torch::IntArrayRef({ 2, 100 }));
        EXPECT_NEAR(res.p[1].max().item<float>(), 9.0f, 1e-4) << "interp " << interp;
        // 步长按 1/(1+t) 衰减，200 步的总位移约为 5.88
        EXPECT_GE(res.p[1].min().item<float>(), 5.5f) << "interp " << interp;
        EXPECT_TRUE(torch::allclose(res.p[0], res.inds.select(1, 0).to(torch::kFloat32), 1e-5, 1e-4));
    }
}

TEST(FollowFlows, StartsFromMaskPixels)
{
    torch::Tensor dP = constant_x_field(8, 8);
    torch::Tensor mask = torch::zeros({ 8, 8 }, torch::kBool);
    paint_box(mask, 2, 5, 1, 4, 1);
    AdvectResult res = follow_flows(dP, mask, {}, 10, true);
    EXPECT_TRUE(torch::equal(res.inds, torch::nonzero(mask)));
    EXPECT_EQ(res.p.size(1), 9);
    EXPECT_FALSE(res.trace.defined());
}

TEST(FollowFlows, Trace)
{
    torch::Tensor dP = radial_field(15, 7.0);
    torch::Tensor mask = torch::ones({ 15, 15 }, torch::kBool);
    const int niter = 20;
    for (bool interp : { true, false }) {
        AdvectResult res = follow_flows(dP, mask, {}, niter, interp, torch::kCPU, true);
        ASSERT_TRUE(res.trace.defined());
        ASSERT_EQ(res.trace.sizes(), torch::IntArrayRef({ niter + 1, 2, 225 }));
        EXPECT_TRUE(torch::allclose(res.trace[0], res.inds.t().to(torch::kFloat32), 1e-5, 1e-4));
        EXPECT_TRUE(torch::allclose(res.trace[niter], res.p, 1e-5, 1e-4));
    }
}

TEST(FollowFlows, TooFewPointsAreNotMoved)
{
    torch::Tensor dP = constant_x_field(8, 8);
    torch::Tensor mask = torch::zeros({ 8, 8 }, torch::kBool);
    mask[1][1] = true;
    mask[2][2] = true;
    mask[3][3] = true;
    AdvectResult res = follow_flows(dP, mask, {}, 50, true, torch::kCPU, true);
    EXPECT_TRUE(torch::equal(res.p, res.inds.t().to(torch::kFloat32)));
    EXPECT_FALSE(res.trace.defined());
}

TEST(FollowFlows, MagnitudeSelectsStartPoints)
{
    torch::Tensor dP = torch::zeros({ 2, 6, 6 });
    using torch::indexing::Slice;
    dP.index_put_({ 1, Slice(1, 4), Slice(1, 3) }, 1.0f);
    AdvectResult res = follow_flows(dP, {}, {}, 5, false);
    EXPECT_EQ(res.inds.size(0), 6);
}

TEST(FollowFlows, OneDimensionalFallsBackToNearest)
{
    torch::Tensor dP = torch::ones({ 1, 12 });
    torch::Tensor mask = torch::ones({ 12 }, torch::kBool);
    AdvectResult res = follow_flows(dP, mask, {}, 200, true);
    EXPECT_NEAR(res.p.max().item<float>(), 11.0f, 1e-5);
}

TEST(FollowFlows, ThreeDimensionalInterp)
{
    torch::Tensor dP = torch::zeros({ 3, 6, 6, 6 });
    dP[0].fill_(1.0f);
    torch::Tensor mask = torch::ones({ 6, 6, 6 }, torch::kBool);
    AdvectResult res = follow_flows(dP, mask, {}, 100, true);
    EXPECT_NEAR(res.p[0].max().item<float>(), 5.0f, 1e-4);
    EXPECT_TRUE(torch::allclose(res.p[2], res.inds.select(1, 2).to(torch::kFloat32), 1e-5, 1e-4));
}

TEST(FollowFlows, MatOverload)
{
    cv::Mat dP(10, 10, CV_32FC2, cv::Scalar(0.0f, 1.0f));
    std::vector<cv::Point> start = { cv::Point(0, 3), cv::Point(8, 6) };
    cv::Mat out = follow_flows(dP, start, 200);
    ASSERT_EQ(out.rows, 2);
    ASSERT_EQ(out.type(), CV_32FC2);
    // 输出坐标顺序为 (y, x)
    EXPECT_NEAR(out.at<cv::Vec2f>(0, 0)[0], 3.0f, 1e-4);
    EXPECT_GT(out.at<cv::Vec2f>(0, 0)[1], 5.5f);
    EXPECT_LT(out.at<cv::Vec2f>(0, 0)[1], 6.2f);
    EXPECT_NEAR(out.at<cv::Vec2f>(1, 0)[1], 9.0f, 1e-4);
    EXPECT_TRUE(follow_flows(dP, std::vector<cv::Point>{}, 10).empty());
}

// ---- flow preprocessing -----------------------------------------------------

TEST(Divergence, LinearField)
{
    torch::Tensor r = torch::arange(7, torch::kFloat32);
    std::vector<torch::Tensor> grid = torch::meshgrid({ r, r }, "ij");
    torch::Tensor f = torch::stack({ grid[0], grid[1] });
    torch::Tensor div = divergence(f);
    EXPECT_TRUE(torch::allclose(div, torch::full({ 7, 7 }, 2.0f)));
}

TEST(Divergence, RescaleZeroOutsideMask)
{
    torch::Tensor dP = radial_field(15, 7.0) * 5.0;
    torch::Tensor mask = torch::zeros({ 15, 15 }, torch::kBool);
    paint_box(mask, 3, 12, 3, 12, 1);
    torch::Tensor out = div_rescale(dP, mask);
    EXPECT_EQ(out.sizes(), dP.sizes());
    EXPECT_EQ(out.abs().sum(0).masked_select(mask.logical_not()).max().item<float>(), 0.0f);
    EXPECT_TRUE(out.abs().sum().item<float>() > 0.0f);
}

TEST(Dynamics, StepFactor)
{
    EXPECT_DOUBLE_EQ(step_factor(0), 1.0);
    EXPECT_DOUBLE_EQ(step_factor(9), 10.0);
}
