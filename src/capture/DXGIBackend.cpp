#include "DXGIBackend.hpp"
#include "FormatNegotiation.hpp"
#include "../util/Logger.hpp"

using Microsoft::WRL::ComPtr;

namespace roi_capture {

    static_assert(hr::InvalidCall == static_cast<HResult>(DXGI_ERROR_INVALID_CALL));
    static_assert(hr::NotFound == static_cast<HResult>(DXGI_ERROR_NOT_FOUND));
    static_assert(hr::Unsupported == static_cast<HResult>(DXGI_ERROR_UNSUPPORTED));
    static_assert(hr::DeviceRemoved == static_cast<HResult>(DXGI_ERROR_DEVICE_REMOVED));
    static_assert(hr::DeviceReset == static_cast<HResult>(DXGI_ERROR_DEVICE_RESET));
    static_assert(hr::AccessLost == static_cast<HResult>(DXGI_ERROR_ACCESS_LOST));
    static_assert(hr::WaitTimeout == static_cast<HResult>(DXGI_ERROR_WAIT_TIMEOUT));
    static_assert(hr::SessionDisconnected == static_cast<HResult>(DXGI_ERROR_SESSION_DISCONNECTED));
    static_assert(hr::Fail == static_cast<HResult>(E_FAIL));

    static DXGI_FORMAT ToDxgiFormat(PixelFormat f) {
        switch (f) {
        case PixelFormat::BGRA8:    return DXGI_FORMAT_B8G8R8A8_UNORM;
        case PixelFormat::RGBA8:    return DXGI_FORMAT_R8G8B8A8_UNORM;
        case PixelFormat::RGBA_F16: return DXGI_FORMAT_R16G16B16A16_FLOAT;
        default:                    return DXGI_FORMAT_UNKNOWN;
        }
    }

    static CaptureResult sessionFailure(CaptureError& err, CaptureResult r, HRESULT hr, const wchar_t* what) {
        err = { r, static_cast<HResult>(hr), what };
        Logger::Error(L"{}, HRESULT: 0x{:x}", what, static_cast<unsigned>(hr));
        return r;
    }

    // ---- DXGISession ----------------------------------------------------------

    HResult DXGISession::AcquireNextFrame(std::uint32_t timeoutMs, bool& hasFrame) {
        hasFrame = false;
        DXGI_OUTDUPL_FRAME_INFO frameInfo{};
        ComPtr<IDXGIResource> resource;
        HRESULT hr = dupl->AcquireNextFrame(timeoutMs, &frameInfo, &resource);
        if (SUCCEEDED(hr)) {
            frame_ = resource;
            hasFrame = resource != nullptr;
        }
        return static_cast<HResult>(hr);
    }

    HResult DXGISession::ReleaseFrame() {
        frame_.Reset();
        return static_cast<HResult>(dupl->ReleaseFrame());
    }

    HResult DXGISession::CreateStagingSurface(std::uint32_t width, std::uint32_t height,
        std::unique_ptr<IStagingSurface>& out)
    {
        D3D11_TEXTURE2D_DESC stagingDesc{};
        stagingDesc.Width = width;
        stagingDesc.Height = height;
        stagingDesc.MipLevels = 1;
        stagingDesc.ArraySize = 1;
        stagingDesc.Format = ToDxgiFormat(format);
        stagingDesc.SampleDesc.Count = 1;
        stagingDesc.Usage = D3D11_USAGE_STAGING;
        stagingDesc.BindFlags = 0;
        stagingDesc.CPUAccessFlags = D3D11_CPU_ACCESS_READ;
        stagingDesc.MiscFlags = 0;

        ComPtr<ID3D11Texture2D> staging;
        HRESULT hr = device->CreateTexture2D(&stagingDesc, nullptr, &staging);
        if (FAILED(hr)) return static_cast<HResult>(hr);

        out = std::make_unique<DXGIStagingSurface>(std::move(staging), width, height);
        return hr::Ok;
    }

    HResult DXGISession::CopyFrameRegion(IStagingSurface& dst, const Region& src) {
        if (!frame_) return hr::InvalidCall;

        ComPtr<ID3D11Texture2D> texture;
        HRESULT hr = frame_.As(&texture);
        if (FAILED(hr)) return static_cast<HResult>(hr);

        D3D11_BOX box{};
        box.left = src.left;
        box.top = src.top;
        box.front = 0;
        box.right = src.left + src.width;
        box.bottom = src.top + src.height;
        box.back = 1;

        auto& staging = static_cast<DXGIStagingSurface&>(dst);
        context->CopySubresourceRegion(staging.Texture(), 0, 0, 0, 0, texture.Get(), 0, &box);
        return hr::Ok;
    }

    HResult DXGISession::Map(IStagingSurface& surface, MappedSurface& out) {
        auto& staging = static_cast<DXGIStagingSurface&>(surface);
        D3D11_MAPPED_SUBRESOURCE mapped{};
        HRESULT hr = context->Map(staging.Texture(), 0, D3D11_MAP_READ, 0, &mapped);
        if (FAILED(hr)) return static_cast<HResult>(hr);
        out.data = static_cast<const std::uint8_t*>(mapped.pData);
        out.rowPitch = mapped.RowPitch;
        return hr::Ok;
    }

    void DXGISession::Unmap(IStagingSurface& surface) {
        auto& staging = static_cast<DXGIStagingSurface&>(surface);
        context->Unmap(staging.Texture(), 0);
    }

    // ---- DXGIBackend ----------------------------------------------------------

    CaptureResult DXGIBackend::CreateSession(const CaptureConfig& cfg,
        std::unique_ptr<IDuplicationSession>& out, CaptureError& err)
    {
        out.reset();
        auto session = std::make_unique<DXGISession>();

        const D3D_FEATURE_LEVEL levels[] = { D3D_FEATURE_LEVEL_11_0 };
        D3D_FEATURE_LEVEL fl;
        HRESULT hr = D3D11CreateDevice(
            nullptr, D3D_DRIVER_TYPE_HARDWARE, nullptr,
            D3D11_CREATE_DEVICE_BGRA_SUPPORT, levels, ARRAYSIZE(levels), D3D11_SDK_VERSION,
            &session->device, &fl, &session->context);
        if (FAILED(hr)) {
            return sessionFailure(err, CaptureResult::DeviceInitError, hr, L"Failed to create D3D11 device");
        }

        ComPtr<IDXGIDevice> dxgiDevice;
        if (FAILED(hr = session->device.As(&dxgiDevice))) {
            return sessionFailure(err, CaptureResult::DeviceInitError, hr, L"D3D11 device has no IDXGIDevice");
        }
        ComPtr<IDXGIAdapter> adapter;
        if (FAILED(hr = dxgiDevice->GetAdapter(&adapter))) {
            return sessionFailure(err, CaptureResult::DeviceInitError, hr, L"Failed to get DXGI adapter");
        }
        ComPtr<IDXGIOutput> output;
        if (FAILED(hr = adapter->EnumOutputs(cfg.outputIndex, &output))) {
            return sessionFailure(err, CaptureResult::DeviceInitError, hr, L"Configured output not found on adapter");
        }
        if (FAILED(hr = output.As(&session->output))) {
            return sessionFailure(err, CaptureResult::DeviceInitError, hr, L"Output does not support duplication");
        }

        DXGI_OUTPUT_DESC desc{};
        if (FAILED(hr = output->GetDesc(&desc))) {
            return sessionFailure(err, CaptureResult::DeviceInitError, hr, L"Failed to read output description");
        }
        session->desc.width = static_cast<std::uint32_t>(desc.DesktopCoordinates.right - desc.DesktopCoordinates.left);
        session->desc.height = static_cast<std::uint32_t>(desc.DesktopCoordinates.bottom - desc.DesktopCoordinates.top);

        ComPtr<IDXGIOutput6> output6;
        if (SUCCEEDED(output.As(&output6))) {
            detectHDR(output6.Get(), session->desc);
            HResult negotiated = NegotiateFormat(FormatCandidates(),
                [&](PixelFormat candidate) {
                    DXGI_FORMAT fmt = ToDxgiFormat(candidate);
                    return static_cast<HResult>(output6->DuplicateOutput1(session->device.Get(), 0, 1, &fmt, &session->dupl));
                },
                session->format);
            if (hr::Failed(negotiated)) {
                return sessionFailure(err, CaptureResult::DuplicationError, negotiated, L"No duplication format accepted by the output");
            }
        }
        else {
            // Pre-1803 output: legacy duplication always delivers BGRA8
            hr = session->output->DuplicateOutput(session->device.Get(), &session->dupl);
            if (FAILED(hr)) {
                return sessionFailure(err, CaptureResult::DuplicationError, hr, L"Failed to duplicate output");
            }
            session->format = PixelFormat::BGRA8;
        }

        DXGI_OUTDUPL_DESC dd{};
        session->dupl->GetDesc(&dd);
        if (dd.Rotation == DXGI_MODE_ROTATION_ROTATE90 || dd.Rotation == DXGI_MODE_ROTATION_ROTATE270) {
            // Frames arrive unrotated; regions address the frame texture
            session->desc.width = dd.ModeDesc.Width;
            session->desc.height = dd.ModeDesc.Height;
            Logger::Warn(L"Output is rotated, regions use unrotated frame coordinates {}x{}",
                session->desc.width, session->desc.height);
        }

        Logger::Debug(L"DXGI duplication on output {} ({}x{}, {})", cfg.outputIndex,
            session->desc.width, session->desc.height, ToString(session->format));
        out = std::move(session);
        return CaptureResult::Success;
    }

    void DXGIBackend::detectHDR(IDXGIOutput6* output6, OutputDesc& desc) {
        desc.hdrEnabled = false;

        DXGI_OUTPUT_DESC1 outputDesc1{};
        if (FAILED(output6->GetDesc1(&outputDesc1))) return;

        desc.hdrEnabled = outputDesc1.ColorSpace == DXGI_COLOR_SPACE_RGB_FULL_G2084_NONE_P2020
            || outputDesc1.MaxLuminance > 400.0f;
        desc.hdr.maxLuminance = outputDesc1.MaxLuminance;
        desc.hdr.minLuminance = outputDesc1.MinLuminance;
        desc.hdr.maxContentLightLevel = outputDesc1.MaxFullFrameLuminance;

        Logger::Info(L"HDR detection: {} (ColorSpace: {}, MaxLuminance: {})",
            desc.hdrEnabled ? L"Yes" : L"No",
            static_cast<int>(outputDesc1.ColorSpace),
            outputDesc1.MaxLuminance);
    }

    std::unique_ptr<ICaptureBackend> CreateDefaultBackend() {
        return std::make_unique<DXGIBackend>();
    }

} // namespace roi_capture
