#include "blur_opencl.hpp"
#include <stdexcept>
#include <string>

#ifdef HAS_OPENCL
#define CL_TARGET_OPENCL_VERSION 120
#ifdef __APPLE__
#include <OpenCL/opencl.h>
#else
#include <CL/cl.h>
#endif
#include <cstring>
#endif

namespace xorblur {

#ifdef HAS_OPENCL
struct BlurOpenCLEngine::Impl {
    cl_context context = nullptr;
    cl_command_queue queue = nullptr;
    cl_program program = nullptr;
    cl_kernel forward = nullptr;
    cl_kernel inverse = nullptr;
    cl_device_id device = nullptr;

    void create(cl_platform_id platform);

    void release() {
        if (forward) { clReleaseKernel(forward); forward = nullptr; }
        if (inverse) { clReleaseKernel(inverse); inverse = nullptr; }
        if (program) { clReleaseProgram(program); program = nullptr; }
        if (queue) { clReleaseCommandQueue(queue); queue = nullptr; }
        if (context) { clReleaseContext(context); context = nullptr; }
    }

    ~Impl() { release(); }
};

namespace {

const char* BLUR_KERNEL_SOURCE = R"(
uchar shift_at(ulong i, uchar mask, uchar fixed_shift, uint dynamic) {
    return dynamic ? (uchar)((i + mask) & 7) : fixed_shift;
}

__kernel void blur_forward(__global const uchar* input,
                           __global uchar* output,
                           const uchar k1,
                           const uchar k2,
                           const uchar mask,
                           const uchar fixed_shift,
                           const uint dynamic,
                           const ulong size) {
    size_t idx = get_global_id(0);
    if (idx < size) {
        uchar s = shift_at(idx, mask, fixed_shift, dynamic);
        uchar v = input[idx] ^ k1;
        if (s != 0) {
            v = (uchar)((v << s) | (v >> (8 - s)));
        }
        output[idx] = v ^ k2;
    }
}

__kernel void blur_inverse(__global const uchar* input,
                           __global uchar* output,
                           const uchar k1,
                           const uchar k2,
                           const uchar mask,
                           const uchar fixed_shift,
                           const uint dynamic,
                           const ulong size) {
    size_t idx = get_global_id(0);
    if (idx < size) {
        uchar s = shift_at(idx, mask, fixed_shift, dynamic);
        uchar v = input[idx] ^ k2;
        if (s != 0) {
            v = (uchar)((v >> s) | (v << (8 - s)));
        }
        output[idx] = v ^ k1;
    }
}
)";

void check(cl_int err, const char* what) {
    if (err != CL_SUCCESS) {
        throw std::runtime_error(std::string(what) + " failed (error " + std::to_string(err) + ")");
    }
}

struct MemObject {
    cl_mem handle = nullptr;
    ~MemObject() { if (handle) clReleaseMemObject(handle); }
};

}

void BlurOpenCLEngine::Impl::create(cl_platform_id platform) {
    cl_int err = clGetDeviceIDs(platform, CL_DEVICE_TYPE_GPU, 1, &device, nullptr);
    if (err != CL_SUCCESS) {
        err = clGetDeviceIDs(platform, CL_DEVICE_TYPE_CPU, 1, &device, nullptr);
    }
    check(err, "clGetDeviceIDs");

    context = clCreateContext(nullptr, 1, &device, nullptr, nullptr, &err);
    check(err, "clCreateContext");

    queue = clCreateCommandQueue(context, device, 0, &err);
    check(err, "clCreateCommandQueue");

    const char* source = BLUR_KERNEL_SOURCE;
    size_t sourceLen = strlen(source);
    program = clCreateProgramWithSource(context, 1, &source, &sourceLen, &err);
    check(err, "clCreateProgramWithSource");

    err = clBuildProgram(program, 1, &device, nullptr, nullptr, nullptr);
    if (err != CL_SUCCESS) {
        char log[4096] = {0};
        clGetProgramBuildInfo(program, device, CL_PROGRAM_BUILD_LOG, sizeof(log) - 1, log, nullptr);
        throw std::runtime_error(std::string("Failed to build OpenCL program: ") + log);
    }

    forward = clCreateKernel(program, "blur_forward", &err);
    check(err, "clCreateKernel(blur_forward)");
    inverse = clCreateKernel(program, "blur_inverse", &err);
    check(err, "clCreateKernel(blur_inverse)");
}
#else
struct BlurOpenCLEngine::Impl {};
#endif

BlurOpenCLEngine::BlurOpenCLEngine(const KeyMaterial& key, bool parallel)
    : impl_(new Impl()), initialized_(false), fallback_(key, parallel) {}

BlurOpenCLEngine::~BlurOpenCLEngine() {
    cleanup();
    delete impl_;
}

bool BlurOpenCLEngine::isAvailable() const {
#ifdef HAS_OPENCL
    cl_uint numPlatforms = 0;
    cl_int err = clGetPlatformIDs(0, nullptr, &numPlatforms);
    return (err == CL_SUCCESS && numPlatforms > 0);
#else
    return false;
#endif
}

void BlurOpenCLEngine::initialize() {
#ifdef HAS_OPENCL
    if (initialized_) return;

    cl_int err;
    cl_platform_id platform;
    cl_uint numPlatforms = 0;

    err = clGetPlatformIDs(1, &platform, &numPlatforms);
    if (err != CL_SUCCESS || numPlatforms == 0) {
        throw std::runtime_error("No OpenCL platforms found");
    }

    // Handles created before a failure are released so a later retry starts clean.
    try {
        impl_->create(platform);
    } catch (const std::exception&) {
        impl_->release();
        throw;
    }

    initialized_ = true;
#endif
}

void BlurOpenCLEngine::cleanup() {
#ifdef HAS_OPENCL
    impl_->release();
    initialized_ = false;
#endif
}

void BlurOpenCLEngine::encrypt(const uint8_t* input, uint8_t* output, size_t size) {
#ifdef HAS_OPENCL
    if (size > 0 && isAvailable()) {
        run(true, input, output, size);
        return;
    }
#endif
    fallback_.encrypt(input, output, size);
}

void BlurOpenCLEngine::decrypt(const uint8_t* input, uint8_t* output, size_t size) {
#ifdef HAS_OPENCL
    if (size > 0 && isAvailable()) {
        run(false, input, output, size);
        return;
    }
#endif
    fallback_.decrypt(input, output, size);
}

#ifdef HAS_OPENCL
void BlurOpenCLEngine::run(bool forward, const uint8_t* input, uint8_t* output, size_t size) {
    if (input == nullptr || output == nullptr) {
        throw std::invalid_argument("Null buffer passed with non-zero size");
    }
    if (!initialized_) {
        initialize();
    }

    cl_kernel kernel = forward ? impl_->forward : impl_->inverse;
    const KeyMaterial& key = fallback_.getKeyMaterial();
    cl_int err;

    MemObject inputBuf;
    inputBuf.handle = clCreateBuffer(impl_->context, CL_MEM_READ_ONLY | CL_MEM_COPY_HOST_PTR,
                                     size, const_cast<uint8_t*>(input), &err);
    check(err, "clCreateBuffer(input)");

    MemObject outputBuf;
    outputBuf.handle = clCreateBuffer(impl_->context, CL_MEM_WRITE_ONLY, size, nullptr, &err);
    check(err, "clCreateBuffer(output)");

    cl_uchar k1 = key.keyPart1();
    cl_uchar k2 = key.keyPart2();
    cl_uchar mask = key.shiftMask();
    cl_uchar fixedShift = key.fixedShift();
    cl_uint dynamic = key.isDynamic() ? 1u : 0u;
    cl_ulong sizeU = static_cast<cl_ulong>(size);

    check(clSetKernelArg(kernel, 0, sizeof(cl_mem), &inputBuf.handle), "clSetKernelArg(0)");
    check(clSetKernelArg(kernel, 1, sizeof(cl_mem), &outputBuf.handle), "clSetKernelArg(1)");
    check(clSetKernelArg(kernel, 2, sizeof(cl_uchar), &k1), "clSetKernelArg(2)");
    check(clSetKernelArg(kernel, 3, sizeof(cl_uchar), &k2), "clSetKernelArg(3)");
    check(clSetKernelArg(kernel, 4, sizeof(cl_uchar), &mask), "clSetKernelArg(4)");
    check(clSetKernelArg(kernel, 5, sizeof(cl_uchar), &fixedShift), "clSetKernelArg(5)");
    check(clSetKernelArg(kernel, 6, sizeof(cl_uint), &dynamic), "clSetKernelArg(6)");
    check(clSetKernelArg(kernel, 7, sizeof(cl_ulong), &sizeU), "clSetKernelArg(7)");

    size_t globalSize = size;
    err = clEnqueueNDRangeKernel(impl_->queue, kernel, 1, nullptr,
                                 &globalSize, nullptr, 0, nullptr, nullptr);
    check(err, "clEnqueueNDRangeKernel");

    err = clEnqueueReadBuffer(impl_->queue, outputBuf.handle, CL_TRUE, 0, size, output, 0, nullptr, nullptr);
    check(err, "clEnqueueReadBuffer");
}
#endif

}
