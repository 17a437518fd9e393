#include <gtest/gtest.h>

#include "Asthenosphere.hpp"
#include "OpenCLDiffusion.hpp"
#include "test_support.hpp"

#include <string>

TEST(OpenCLDiffusionTest, MatchesCpuSmoothing) {
    OpenCLDiffusion ocl;
    if (!ocl.is_available()) {
        GTEST_SKIP() << "no OpenCL device";
    }

    Mesh mesh(24, 16, Float3(0, 0, 0), Float3(24, 16, 0));
    ASSERT_TRUE(ocl.init_buffers(mesh));
    EXPECT_TRUE(ocl.is_ready_for(mesh));

    ScalarField density(mesh), gpu(mesh), cpu(mesh);
    test_support::fill_uniform(density, 2500.0f, 3300.0f, 61);

    ScratchArena scratch(mesh);
    Asthenosphere().pressure(density, 15, cpu, scratch);
    ASSERT_TRUE(ocl.smooth(density, 15, 1.0f, gpu));

    for (int_t i = 0; i < mesh.get_ncells(); ++i) {
        EXPECT_NEAR(gpu[i], cpu[i], 1e-2f) << "cell " << i;
    }
}

TEST(OpenCLDiffusionTest, RefusesForeignMesh) {
    OpenCLDiffusion ocl;
    if (!ocl.is_available()) {
        GTEST_SKIP() << "no OpenCL device";
    }

    Mesh mesh = test_support::make_ring(8);
    Mesh other = test_support::make_ring(8);
    ASSERT_TRUE(ocl.init_buffers(mesh));

    ScalarField field(other);
    EXPECT_FALSE(ocl.smooth(field, 1, 1.0f, field));
    EXPECT_FALSE(ocl.is_ready_for(other));
}

TEST(OpenCLDiffusionTest, FailedCallIsReportedWithErrorCode) {
    testing::internal::CaptureStderr();
    EXPECT_FALSE(OpenCLDiffusion::check_status(CL_OUT_OF_RESOURCES, "clEnqueueNDRangeKernel"));
    const std::string log = testing::internal::GetCapturedStderr();
    EXPECT_NE(log.find("clEnqueueNDRangeKernel"), std::string::npos);
    EXPECT_NE(log.find("-5"), std::string::npos);

    testing::internal::CaptureStderr();
    EXPECT_TRUE(OpenCLDiffusion::check_status(CL_SUCCESS, "clFinish"));
    EXPECT_TRUE(testing::internal::GetCapturedStderr().empty());
}

// Без устройства или без init_buffers сглаживание отказывает и сообщает причину
TEST(OpenCLDiffusionTest, SmoothWithoutBuffersReportsFailure) {
    OpenCLDiffusion ocl;
    Mesh mesh = test_support::make_ring(8);
    ScalarField field(mesh, 1.0f);

    testing::internal::CaptureStderr();
    EXPECT_FALSE(ocl.smooth(field, 1, 1.0f, field));
    EXPECT_FALSE(testing::internal::GetCapturedStderr().empty());
}
