#pragma once
#include "Field.hpp"
#ifdef __APPLE__
#include <OpenCL/opencl.h>
#else
#include <CL/cl.h>
#endif
#include <algorithm>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

// Сглаживание (diffusion_by_constant) на OpenCL-устройстве.
// Смежность сетки загружается один раз в init_buffers в виде CSR.
class OpenCLDiffusion {
private:
    cl_platform_id platform = nullptr;
    cl_device_id device = nullptr;
    cl_context context = nullptr;
    cl_command_queue queue = nullptr;
    cl_program program = nullptr;
    cl_kernel kernel = nullptr;

    // Буферы для данных на устройстве
    cl_mem bufCurr = nullptr;
    cl_mem bufNext = nullptr;
    cl_mem bufOffsets = nullptr;
    cl_mem bufNeighbors = nullptr;

    const Mesh* mesh = nullptr;
    bool available = false;
    std::string kernel_src;

public:
    OpenCLDiffusion() {
        build_kernel_source();
        available = init_opencl();
    }

    ~OpenCLDiffusion() {
        release_buffers();
        if (kernel) clReleaseKernel(kernel);
        if (program) clReleaseProgram(program);
        if (queue) clReleaseCommandQueue(queue);
        if (context) clReleaseContext(context);
    }

    OpenCLDiffusion(const OpenCLDiffusion&) = delete;
    OpenCLDiffusion& operator=(const OpenCLDiffusion&) = delete;

    bool is_available() const { return available; }

    // Проверка статуса CL-вызова: при ошибке пишет код в std::cerr
    static bool check_status(cl_int err, const char* call) {
        if (err == CL_SUCCESS) return true;
        std::cerr << "OpenCLDiffusion: " << call << " failed with error " << err << "\n";
        return false;
    }
    bool is_ready_for(const Mesh& m) const { return available && mesh == &m; }

    std::string device_name() const {
        if (!device) return std::string();
        size_t size = 0;
        if (clGetDeviceInfo(device, CL_DEVICE_NAME, 0, nullptr, &size) != CL_SUCCESS || size == 0) {
            return std::string();
        }
        std::string name(size, '\0');
        if (clGetDeviceInfo(device, CL_DEVICE_NAME, size, &name[0], nullptr) != CL_SUCCESS) {
            return std::string();
        }
        name.resize(std::strlen(name.c_str()));
        return name;
    }

    bool init_buffers(const Mesh& m) {
        if (!available) return false;

        release_buffers();
        mesh = nullptr;

        const int_t ncells = m.get_ncells();
        cl_int err = CL_SUCCESS;

        // Буферы значений (ping-pong)
        bufCurr = clCreateBuffer(context, CL_MEM_READ_WRITE,
                                 sizeof(cl_float) * std::max<int_t>(ncells, 1), nullptr, &err);
        if (!check_status(err, "clCreateBuffer(curr)")) return false;

        bufNext = clCreateBuffer(context, CL_MEM_READ_WRITE,
                                 sizeof(cl_float) * std::max<int_t>(ncells, 1), nullptr, &err);
        if (!check_status(err, "clCreateBuffer(next)")) return false;

        // CSR-смежность; пустые массивы заменяем одним элементом
        std::vector<cl_int> offsets(m.get_offsets().begin(), m.get_offsets().end());
        std::vector<cl_int> neighbors(m.get_neighbors().begin(), m.get_neighbors().end());
        if (neighbors.empty()) neighbors.push_back(0);

        bufOffsets = clCreateBuffer(context, CL_MEM_READ_ONLY | CL_MEM_COPY_HOST_PTR,
                                    sizeof(cl_int) * offsets.size(), offsets.data(), &err);
        if (!check_status(err, "clCreateBuffer(offsets)")) return false;

        bufNeighbors = clCreateBuffer(context, CL_MEM_READ_ONLY | CL_MEM_COPY_HOST_PTR,
                                      sizeof(cl_int) * neighbors.size(), neighbors.data(), &err);
        if (!check_status(err, "clCreateBuffer(neighbors)")) return false;

        mesh = &m;
        return true;
    }

    // out = iterations проходов сглаживания по in; out может совпадать с in
    bool smooth(const ScalarField& in, int iterations, float_t k, ScalarField& out) {
        if (!available || !kernel) {
            std::cerr << "OpenCLDiffusion: no OpenCL device or kernel\n";
            return false;
        }
        if (mesh != &in.get_mesh() || mesh != &out.get_mesh()) {
            std::cerr << "OpenCLDiffusion: buffers were initialized for a different mesh\n";
            return false;
        }

        const cl_int ncells = in.size();
        if (ncells == 0) return true;

        cl_int err = clEnqueueWriteBuffer(queue, bufCurr, CL_TRUE, 0,
                                          sizeof(cl_float) * ncells, in.data(),
                                          0, nullptr, nullptr);
        if (!check_status(err, "clEnqueueWriteBuffer")) return false;

        const cl_float constant = k;
        const size_t global = static_cast<size_t>(ncells);
        for (int i = 0; i < iterations; ++i) {
            err  = clSetKernelArg(kernel, 0, sizeof(cl_mem), &bufCurr);
            err |= clSetKernelArg(kernel, 1, sizeof(cl_mem), &bufNext);
            err |= clSetKernelArg(kernel, 2, sizeof(cl_mem), &bufOffsets);
            err |= clSetKernelArg(kernel, 3, sizeof(cl_mem), &bufNeighbors);
            err |= clSetKernelArg(kernel, 4, sizeof(cl_int), &ncells);
            err |= clSetKernelArg(kernel, 5, sizeof(cl_float), &constant);
            if (!check_status(err, "clSetKernelArg")) return false;

            err = clEnqueueNDRangeKernel(queue, kernel, 1, nullptr, &global, nullptr, 0, nullptr, nullptr);
            if (!check_status(err, "clEnqueueNDRangeKernel")) return false;

            std::swap(bufCurr, bufNext);
        }

        err = clEnqueueReadBuffer(queue, bufCurr, CL_TRUE, 0,
                                  sizeof(cl_float) * ncells, out.data(),
                                  0, nullptr, nullptr);
        return check_status(err, "clEnqueueReadBuffer");
    }

private:
    void release_buffers() {
        if (bufCurr) { clReleaseMemObject(bufCurr); bufCurr = nullptr; }
        if (bufNext) { clReleaseMemObject(bufNext); bufNext = nullptr; }
        if (bufOffsets) { clReleaseMemObject(bufOffsets); bufOffsets = nullptr; }
        if (bufNeighbors) { clReleaseMemObject(bufNeighbors); bufNeighbors = nullptr; }
    }

    void build_kernel_source() {
        kernel_src = R"CLC(
__kernel void diffuse(
    __global const float* curr,
    __global float* next,
    __global const int* offsets,
    __global const int* neighbors,
    const int ncells,
    const float k)
{
    int cell = get_global_id(0);
    if (cell >= ncells) return;

    int begin = offsets[cell];
    int end = offsets[cell + 1];
    float value = curr[cell];

    // ячейка без соседей сохраняет значение
    if (end == begin) {
        next[cell] = value;
        return;
    }

    float total = 0.0f;
    for (int i = begin; i < end; ++i) {
        total += curr[neighbors[i]];
    }
    float average = total / (float)(end - begin);

    next[cell] = value + k * (average - value);
}
)CLC";
    }

    bool init_opencl() {
        cl_int err;
        cl_uint num_platforms = 0;
        err = clGetPlatformIDs(0, nullptr, &num_platforms);
        if (err != CL_SUCCESS || num_platforms == 0) return false;

        std::vector<cl_platform_id> platforms(num_platforms);
        err = clGetPlatformIDs(num_platforms, platforms.data(), nullptr);
        if (err != CL_SUCCESS) return false;

        for (auto &p : platforms) {
            if (pick_device(p, CL_DEVICE_TYPE_GPU) || pick_device(p, CL_DEVICE_TYPE_CPU)) break;
        }

        if (!device) return false;

        context = clCreateContext(nullptr, 1, &device, nullptr, nullptr, &err);
        if (err != CL_SUCCESS) return false;

        queue = clCreateCommandQueue(context, device, 0, &err);
        if (err != CL_SUCCESS) return false;

        const char* src = kernel_src.c_str();
        size_t src_len = kernel_src.size();
        program = clCreateProgramWithSource(context, 1, &src, &src_len, &err);
        if (err != CL_SUCCESS) return false;

        err = clBuildProgram(program, 1, &device, nullptr, nullptr, nullptr);
        if (err != CL_SUCCESS) {
            size_t log_size = 0;
            clGetProgramBuildInfo(program, device, CL_PROGRAM_BUILD_LOG, 0, nullptr, &log_size);
            std::string log(log_size, '\0');
            clGetProgramBuildInfo(program, device, CL_PROGRAM_BUILD_LOG, log_size, &log[0], nullptr);
            std::cerr << "Build failed:\n" << log << "\n";
            return false;
        }

        kernel = clCreateKernel(program, "diffuse", &err);
        if (err != CL_SUCCESS) return false;

        return true;
    }

    bool pick_device(cl_platform_id p, cl_device_type type) {
        cl_uint num_devices = 0;
        if (clGetDeviceIDs(p, type, 0, nullptr, &num_devices) != CL_SUCCESS || num_devices == 0) {
            return false;
        }
        std::vector<cl_device_id> devices(num_devices);
        if (clGetDeviceIDs(p, type, num_devices, devices.data(), nullptr) != CL_SUCCESS) {
            return false;
        }
        platform = p;
        device = devices[0];
        return true;
    }
};
