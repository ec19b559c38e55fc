#include <gtest/gtest.h>
#include "Postprocess.h"
#include "test_helpers.h"

// ---- remove_small_masks -----------------------------------------------------

TEST(RemoveSmallMasks, DropsAndRenumbers)
{
    torch::Tensor labels = torch::zeros({ 20, 20 }, torch::kInt64);
    paint_box(labels, 0, 2, 0, 2, 3);      // 4 像素
    paint_box(labels, 5, 10, 5, 10, 8);    // 25 像素
    torch::Tensor out = remove_small_masks(labels, 15);
    EXPECT_EQ(out.max().item<int64_t>(), 1);
    EXPECT_EQ(out[0][0].item<int64_t>(), 0);
    EXPECT_EQ(out[7][7].item<int64_t>(), 1);
}

TEST(RemoveSmallMasks, DisabledKeepsAll)
{
    torch::Tensor labels = torch::zeros({ 6, 6 }, torch::kInt64);
    labels[1][1] = 4;
    labels[4][4] = 9;
    torch::Tensor out = remove_small_masks(labels, -1);
    EXPECT_EQ(out.max().item<int64_t>(), 2);
}

// ---- fill_holes_single_mask -------------------------------------------------

TEST(FillHolesSingleMask, Ring)
{
    cv::Mat ring(7, 7, CV_8U, cv::Scalar(0));
    cv::rectangle(ring, cv::Rect(1, 1, 5, 5), cv::Scalar(1), cv::FILLED);
    cv::rectangle(ring, cv::Rect(2, 2, 3, 3), cv::Scalar(0), cv::FILLED);

    cv::Mat filled = fill_holes_single_mask(ring);
    EXPECT_EQ(filled.type(), CV_8U);
    EXPECT_EQ(cv::countNonZero(filled), 25);
    EXPECT_EQ(filled.at<uchar>(3, 3), 255);
    EXPECT_EQ(filled.at<uchar>(0, 0), 0);

    // 孔洞面积 9，不小于上限时保留
    EXPECT_EQ(cv::countNonZero(fill_holes_single_mask(ring, 9.0)), 16);
    EXPECT_EQ(cv::countNonZero(fill_holes_single_mask(ring, 10.0)), 25);
}

TEST(FillHolesSingleMask, OpenNotchIsNotAHole)
{
    // 缺口接触图像边缘
    cv::Mat m(5, 5, CV_8U, cv::Scalar(255));
    m.at<uchar>(0, 2) = 0;
    m.at<uchar>(1, 2) = 0;
    EXPECT_EQ(cv::countNonZero(fill_holes_single_mask(m)), 23);
}

// ---- fill_holes_and_remove_small_masks --------------------------------------

TEST(FillHoles, SmallHoleFilled)
{
    torch::Tensor labels = torch::zeros({ 20, 20 }, torch::kInt64);
    paint_box(labels, 5, 15, 5, 15, 1);
    labels[9][9] = 0;
    torch::Tensor out = fill_holes_and_remove_small_masks(labels, 15, 3);
    EXPECT_EQ(out[9][9].item<int64_t>(), 1);
    EXPECT_EQ(pixel_count(out), 100);
}

TEST(FillHoles, HoleSizeRelativeToInstance)
{
    torch::Tensor labels = torch::zeros({ 30, 30 }, torch::kInt64);
    paint_box(labels, 5, 25, 5, 25, 1);
    paint_box(labels, 13, 17, 13, 17, 0);

    torch::Tensor kept = fill_holes_and_remove_small_masks(labels, 15, 3);
    EXPECT_EQ(kept[14][14].item<int64_t>(), 0);
    EXPECT_EQ(pixel_count(kept), 384);

    torch::Tensor filled = fill_holes_and_remove_small_masks(labels, 15, 50);
    EXPECT_EQ(filled[14][14].item<int64_t>(), 1);
    EXPECT_EQ(pixel_count(filled), 400);
}

TEST(FillHoles, ThreeDimensionalSlices)
{
    torch::Tensor labels = torch::zeros({ 3, 12, 12 }, torch::kInt64);
    using torch::indexing::Slice;
    labels.index_put_({ Slice(), Slice(2, 10), Slice(2, 10) }, 5);
    labels.index_put_({ 1, Slice(4, 8), Slice(4, 8) }, 0);
    torch::Tensor out = fill_holes_and_remove_small_masks(labels, 15, 3);
    EXPECT_EQ(out[1][5][5].item<int64_t>(), 1);
    EXPECT_EQ(pixel_count(out), 3 * 64);
}

TEST(FillHoles, RemovesSmallAndRenumbers)
{
    torch::Tensor labels = torch::zeros({ 30, 30 }, torch::kInt64);
    paint_box(labels, 2, 8, 2, 8, 3);
    paint_box(labels, 20, 22, 20, 22, 5);
    paint_box(labels, 12, 18, 12, 18, 7);
    torch::Tensor out = fill_holes_and_remove_small_masks(labels, 15, 3);
    EXPECT_EQ(out.max().item<int64_t>(), 2);
    EXPECT_EQ(out[4][4].item<int64_t>(), 1);
    EXPECT_EQ(out[15][15].item<int64_t>(), 2);
    EXPECT_EQ(out[21][21].item<int64_t>(), 0);
}

TEST(FillHoles, Idempotent)
{
    torch::Tensor labels = torch::zeros({ 30, 30 }, torch::kInt64);
    paint_box(labels, 2, 12, 2, 12, 1);
    paint_box(labels, 15, 28, 15, 28, 2);
    labels[6][6] = 0;
    labels[20][20] = 0;
    torch::Tensor once = fill_holes_and_remove_small_masks(labels, 15, 3);
    torch::Tensor twice = fill_holes_and_remove_small_masks(once, 15, 3);
    EXPECT_TRUE(torch::equal(once, twice));
}

TEST(FillHoles, IdempotentNearHoleThreshold)
{
    // 40x40 实例: 45 px 和 46 px 的孔洞都小于 3% 的填充面积 (48 px)，49 px 的孔洞保留
    torch::Tensor labels = torch::zeros({ 50, 50 }, torch::kInt64);
    paint_box(labels, 5, 45, 5, 45, 1);
    paint_box(labels, 10, 15, 10, 19, 0);
    paint_box(labels, 25, 27, 10, 33, 0);
    paint_box(labels, 33, 40, 33, 40, 0);
    ASSERT_EQ(pixel_count(labels), 1600 - 45 - 46 - 49);

    torch::Tensor once = fill_holes_and_remove_small_masks(labels, 15, 3);
    torch::Tensor twice = fill_holes_and_remove_small_masks(once, 15, 3);
    EXPECT_TRUE(torch::equal(once, twice));
    EXPECT_EQ(pixel_count(once), 1600 - 49);
    EXPECT_EQ(once[12][14].item<int64_t>(), 1);
    EXPECT_EQ(once[26][20].item<int64_t>(), 1);
    EXPECT_EQ(once[36][36].item<int64_t>(), 0);
}

TEST(FillHoles, RejectsOtherRanks)
{
    EXPECT_THROW(fill_holes_and_remove_small_masks(torch::zeros({ 10 }, torch::kInt64)), c10::Error);
    EXPECT_THROW(fill_holes_and_remove_small_masks(torch::zeros({ 2, 2, 2, 2 }, torch::kInt64)), c10::Error);
}

TEST(FillHoles, MatOverload)
{
    cv::Mat labels(20, 20, CV_16UC1, cv::Scalar(0));
    cv::rectangle(labels, cv::Rect(4, 4, 10, 10), cv::Scalar(12), cv::FILLED);
    labels.at<unsigned short>(8, 8) = 0;
    cv::Mat out = fill_holes_and_remove_small_masks(labels, 15, 3);
    EXPECT_EQ(out.type(), CV_32SC1);
    EXPECT_EQ(out.at<int>(8, 8), 1);
    EXPECT_EQ(cv::countNonZero(out), 100);
}
