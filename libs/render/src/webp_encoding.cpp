#include <motlib/core/logging.hpp>
#include <motlib/render/webp_encoding.hpp>

#include <tracy/Tracy.hpp>
#include <webp/encode.h>
#include <webp/mux.h>

#include <memory>
#include <string>

namespace motlib::render {

namespace {

bool initConfig(WebPParams const& params, WebPConfig& outConfig) {
  if (!WebPConfigInit(&outConfig)) {
    MOTLIB_LOG_ERR("libwebp version mismatch.");
    return false;
  }

  outConfig.quality = params.quality;
  outConfig.method = params.method;

  if (!WebPValidateConfig(&outConfig)) {
    MOTLIB_LOG_ERR("Invalid WebP encoder parameters.");
    return false;
  }

  return true;
}

bool importPicture(Image const& image, WebPPicture& outPicture) {
  if (image.width <= 0 || image.height <= 0 ||
      image.pixels.size() != image.rowSize() * image.height) {
    MOTLIB_LOG_ERR("Image buffer does not match its extent.");
    return false;
  }

  if (!WebPPictureInit(&outPicture)) {
    MOTLIB_LOG_ERR("libwebp version mismatch.");
    return false;
  }

  outPicture.use_argb = 1;
  outPicture.width = image.width;
  outPicture.height = image.height;

  if (!WebPPictureImportRGB(&outPicture, image.pixels.data(),
                            static_cast<int>(image.rowSize()))) {
    MOTLIB_LOG_ERR("Failed to import pixels into WebP picture.");
    WebPPictureFree(&outPicture);
    return false;
  }

  return true;
}

} /*namespace*/

bool encodeStillWebP(Image const& image, WebPParams const& params,
                     std::vector<char>& outBytes) {
  ZoneScoped;

  WebPConfig config;
  if (!initConfig(params, config)) {
    return false;
  }

  WebPPicture picture;
  if (!importPicture(image, picture)) {
    return false;
  }

  WebPMemoryWriter writer;
  WebPMemoryWriterInit(&writer);
  picture.writer = WebPMemoryWrite;
  picture.custom_ptr = &writer;

  bool const encoded = WebPEncode(&config, &picture);

  if (encoded) {
    outBytes.assign(reinterpret_cast<char const*>(writer.mem),
                    reinterpret_cast<char const*>(writer.mem) + writer.size);
  } else {
    MOTLIB_LOG_ERR("WebP encoding failed with code " +
                   std::to_string(picture.error_code));
  }

  WebPPictureFree(&picture);
  WebPMemoryWriterClear(&writer);

  return encoded;
}

bool encodeAnimatedWebP(std::vector<Image> const& frames, int frameDurationMs,
                        WebPParams const& params, std::vector<char>& outBytes) {
  ZoneScoped;

  if (frames.empty()) {
    MOTLIB_LOG_ERR("Cannot encode an animation without frames.");
    return false;
  }

  WebPConfig config;
  if (!initConfig(params, config)) {
    return false;
  }

  int const width = frames.front().width;
  int const height = frames.front().height;

  WebPAnimEncoderOptions encoderOptions;
  if (!WebPAnimEncoderOptionsInit(&encoderOptions)) {
    MOTLIB_LOG_ERR("libwebpmux version mismatch.");
    return false;
  }
  encoderOptions.anim_params.loop_count = 0;

  using EncoderDeleter = void (*)(WebPAnimEncoder*);
  std::unique_ptr<WebPAnimEncoder, EncoderDeleter> encoder{
      WebPAnimEncoderNew(width, height, &encoderOptions),
      [](WebPAnimEncoder* e) {
        if (e)
          WebPAnimEncoderDelete(e);
      }};

  if (!encoder) {
    MOTLIB_LOG_ERR("Failed to create WebP animation encoder.");
    return false;
  }

  int timestampMs = 0;

  for (Image const& frame : frames) {
    ZoneScopedN("Add animation frame");

    if (frame.width != width || frame.height != height) {
      MOTLIB_LOG_ERR("Animation frames differ in extent.");
      return false;
    }

    WebPPicture picture;
    if (!importPicture(frame, picture)) {
      return false;
    }

    bool const added =
        WebPAnimEncoderAdd(encoder.get(), &picture, timestampMs, &config);
    WebPPictureFree(&picture);

    if (!added) {
      MOTLIB_LOG_ERR(std::string{"Failed to add animation frame: "} +
                     WebPAnimEncoderGetError(encoder.get()));
      return false;
    }

    timestampMs += frameDurationMs;
  }

  // A null frame closes the animation and fixes the last frame's duration.
  if (!WebPAnimEncoderAdd(encoder.get(), nullptr, timestampMs, nullptr)) {
    MOTLIB_LOG_ERR(std::string{"Failed to finish animation: "} +
                   WebPAnimEncoderGetError(encoder.get()));
    return false;
  }

  WebPData webpData;
  WebPDataInit(&webpData);

  if (!WebPAnimEncoderAssemble(encoder.get(), &webpData)) {
    MOTLIB_LOG_ERR(std::string{"Failed to assemble animation: "} +
                   WebPAnimEncoderGetError(encoder.get()));
    WebPDataClear(&webpData);
    return false;
  }

  outBytes.assign(reinterpret_cast<char const*>(webpData.bytes),
                  reinterpret_cast<char const*>(webpData.bytes) +
                      webpData.size);
  WebPDataClear(&webpData);

  return true;
}

} /*namespace motlib::render*/
