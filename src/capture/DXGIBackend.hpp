#pragma once
#include "CaptureBackend.hpp"
#include "../platform/WinHeaders.hpp"

namespace roi_capture {

    class DXGIStagingSurface : public IStagingSurface {
    public:
        DXGIStagingSurface(Microsoft::WRL::ComPtr<ID3D11Texture2D> texture, UINT width, UINT height)
            : texture_(std::move(texture)), width_(width), height_(height) {}

        std::uint32_t Width() const override { return width_; }
        std::uint32_t Height() const override { return height_; }
        bool IsValid() const override { return texture_ != nullptr; }
        ID3D11Texture2D* Texture() const { return texture_.Get(); }

    private:
        Microsoft::WRL::ComPtr<ID3D11Texture2D> texture_;
        UINT width_ = 0;
        UINT height_ = 0;
    };

    // Device, immediate context, output and duplication of one output, released together.
    class DXGISession : public IDuplicationSession {
    public:
        const OutputDesc& Output() const override { return desc; }
        PixelFormat Format() const override { return format; }

        HResult AcquireNextFrame(std::uint32_t timeoutMs, bool& hasFrame) override;
        HResult ReleaseFrame() override;
        HResult CreateStagingSurface(std::uint32_t width, std::uint32_t height,
            std::unique_ptr<IStagingSurface>& out) override;
        HResult CopyFrameRegion(IStagingSurface& dst, const Region& src) override;
        HResult Map(IStagingSurface& surface, MappedSurface& out) override;
        void Unmap(IStagingSurface& surface) override;

        Microsoft::WRL::ComPtr<ID3D11Device> device;
        Microsoft::WRL::ComPtr<ID3D11DeviceContext> context;
        Microsoft::WRL::ComPtr<IDXGIOutput1> output;
        Microsoft::WRL::ComPtr<IDXGIOutputDuplication> dupl;
        OutputDesc desc{};
        PixelFormat format = PixelFormat::Unknown;

    private:
        Microsoft::WRL::ComPtr<IDXGIResource> frame_;   // valid between Acquire and Release
    };

    class DXGIBackend : public ICaptureBackend {
    public:
        CaptureResult CreateSession(const CaptureConfig& cfg,
            std::unique_ptr<IDuplicationSession>& out, CaptureError& err) override;

    private:
        static void detectHDR(IDXGIOutput6* output6, OutputDesc& desc);
    };

} // namespace roi_capture
