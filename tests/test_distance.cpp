#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include "Distance.h"
#include "test_helpers.h"

// ---- edt --------------------------------------------------------------------

TEST(Edt, SquareInterior)
{
    torch::Tensor labels = square_labels(20, 5, 15);
    torch::Tensor d = edt(labels);
    EXPECT_EQ(d.scalar_type(), torch::kFloat32);
    EXPECT_FLOAT_EQ(d[9][9].item<float>(), 5.0f);
    EXPECT_FLOAT_EQ(d[5][5].item<float>(), 1.0f);
    EXPECT_FLOAT_EQ(d[5][9].item<float>(), 1.0f);
    EXPECT_FLOAT_EQ(d[0][0].item<float>(), 0.0f);
    EXPECT_FLOAT_EQ(d[7][6].item<float>(), 2.0f);
}

TEST(Edt, DifferentLabelsAreBoundaries)
{
    torch::Tensor labels = torch::tensor({ 1, 1, 2, 2 }, torch::kInt64);
    torch::Tensor d = edt(labels);
    EXPECT_TRUE(torch::equal(d, torch::tensor({ 2.0f, 1.0f, 1.0f, 2.0f })));
}

TEST(Edt, BlackBorder)
{
    torch::Tensor labels = torch::ones({ 5, 5 }, torch::kInt64);
    torch::Tensor open = edt(labels, false);
    EXPECT_TRUE(std::isinf(open[2][2].item<float>()));

    torch::Tensor closed = edt(labels, true);
    EXPECT_FLOAT_EQ(closed[2][2].item<float>(), 3.0f);
    EXPECT_FLOAT_EQ(closed[0][0].item<float>(), 1.0f);
    EXPECT_FLOAT_EQ(closed[1][2].item<float>(), 2.0f);
}

TEST(Edt, ThreeDimensional)
{
    torch::Tensor labels = torch::zeros({ 9, 9, 9 }, torch::kInt64);
    using torch::indexing::Slice;
    labels.index_put_({ Slice(2, 7), Slice(2, 7), Slice(2, 7) }, 4);
    torch::Tensor d = edt(labels);
    EXPECT_FLOAT_EQ(d[4][4][4].item<float>(), 3.0f);
    EXPECT_FLOAT_EQ(d[2][4][4].item<float>(), 1.0f);
}

TEST(Edt, MatchesBruteForceMultiLabel)
{
    // 三个互相接触的标签加一块背景
    torch::Tensor labels = torch::zeros({ 12, 14 }, torch::kInt64);
    using torch::indexing::Slice;
    labels.index_put_({ Slice(0, 7), Slice(0, 9) }, 1);
    labels.index_put_({ Slice(7, 12), Slice(0, 6) }, 2);
    labels.index_put_({ Slice(2, 11), Slice(9, 14) }, 3);

    torch::Tensor d = edt(labels);
    auto lab = labels.accessor<int64_t, 2>();
    for (int64_t y = 0; y < 12; ++y) {
        for (int64_t x = 0; x < 14; ++x) {
            if (lab[y][x] == 0) {
                EXPECT_FLOAT_EQ(d[y][x].item<float>(), 0.0f);
                continue;
            }
            double best = std::numeric_limits<double>::infinity();
            for (int64_t v = 0; v < 12; ++v) {
                for (int64_t u = 0; u < 14; ++u) {
                    if (lab[v][u] == lab[y][x]) continue;
                    best = std::min(best, std::hypot(double(v - y), double(u - x)));
                }
            }
            EXPECT_NEAR(d[y][x].item<float>(), best, 1e-4) << "at (" << y << ", " << x << ")";
        }
    }
}

// ---- diameters --------------------------------------------------------------

TEST(Diameters, SquareEstimate)
{
    torch::Tensor labels = square_labels(20, 5, 15);
    torch::Tensor d = edt(labels);
    const double expected = 6.0 * d.masked_select(d > 0).to(torch::kFloat64).mean().item<double>();
    EXPECT_NEAR(diameters(labels), expected, 1e-6);
    EXPECT_NEAR(dist_to_diam(torch::ones({ 4 }), 2), 6.0, 1e-12);
}

TEST(Diameters, EmptyThrows)
{
    EXPECT_THROW(diameters(torch::zeros({ 8, 8 }, torch::kInt64)), c10::Error);
    EXPECT_THROW(dist_to_diam(torch::zeros({ 0 }), 2), c10::Error);
}

// ---- get_niter --------------------------------------------------------------

TEST(Niter, Values)
{
    EXPECT_EQ(get_niter(torch::tensor({ 2.0f })), 4);
    EXPECT_EQ(get_niter(torch::tensor({ 0.0f, 1.0f })), 3);
    EXPECT_LE(get_niter(torch::tensor({ 5.0f })), get_niter(torch::tensor({ 6.0f })));
}

TEST(Niter, RejectsInfinite)
{
    EXPECT_THROW(get_niter(torch::tensor({ std::numeric_limits<float>::infinity() })), c10::Error);
}
