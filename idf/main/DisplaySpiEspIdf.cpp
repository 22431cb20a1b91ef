#include "DisplaySpiEspIdf.h"

#include "AppConfig.h"

#include "driver/gpio.h"
#include "driver/spi_master.h"
#include "esp_heap_caps.h"
#include "esp_log.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>

namespace {
constexpr const char* kTag = "tft";
constexpr spi_host_device_t kTftHost = SPI3_HOST;
constexpr int kPanelClockHz = 40 * 1000 * 1000;
// Rows per DMA buffer; two buffers alternate so the CPU swaps bytes for the
// next band while the previous one is on the wire.
constexpr uint16_t kRowsPerChunk = 16;
constexpr size_t kChunkPixels = static_cast<size_t>(AppConfig::kPanelHeight) * kRowsPerChunk;

constexpr uint8_t kCmdSleepOut = 0x11;
constexpr uint8_t kCmdSleepIn = 0x10;
constexpr uint8_t kCmdInvertOff = 0x20;
constexpr uint8_t kCmdInvertOn = 0x21;
constexpr uint8_t kCmdDisplayOff = 0x28;
constexpr uint8_t kCmdDisplayOn = 0x29;
constexpr uint8_t kCmdColumnAddr = 0x2A;
constexpr uint8_t kCmdPageAddr = 0x2B;
constexpr uint8_t kCmdMemoryWrite = 0x2C;
constexpr uint8_t kCmdMemoryAccess = 0x36;

struct InitCommand {
  uint8_t cmd;
  uint8_t data[15];
  uint8_t size;
  uint8_t delayMs;
};

// Power, VCOM, pixel format (RGB565), frame rate and gamma.
constexpr InitCommand kIli9341Init[] = {
    {0xCF, {0x00, 0xC1, 0x30}, 3, 0},
    {0xED, {0x64, 0x03, 0x12, 0x81}, 4, 0},
    {0xE8, {0x85, 0x00, 0x78}, 3, 0},
    {0xCB, {0x39, 0x2C, 0x00, 0x34, 0x02}, 5, 0},
    {0xF7, {0x20}, 1, 0},
    {0xEA, {0x00, 0x00}, 2, 0},
    {0xC0, {0x10}, 1, 0},
    {0xC1, {0x00}, 1, 0},
    {0xC5, {0x30, 0x30}, 2, 0},
    {0xC7, {0xB7}, 1, 0},
    {0x3A, {0x55}, 1, 0},
    {0xB1, {0x00, 0x1A}, 2, 0},
    {0xB6, {0x08, 0x82, 0x27}, 3, 0},
    {0xF2, {0x00}, 1, 0},
    {0x26, {0x01}, 1, 0},
    {0xE0, {0x0F, 0x2A, 0x28, 0x08, 0x0E, 0x08, 0x54, 0xA9, 0x43, 0x0A, 0x0F, 0x00, 0x00, 0x00,
            0x00},
     15, 0},
    {0xE1, {0x00, 0x15, 0x17, 0x07, 0x11, 0x06, 0x2B, 0x56, 0x3C, 0x05, 0x10, 0x0F, 0x3F, 0x3F,
            0x0F},
     15, 0},
    {kCmdSleepOut, {0}, 0, 120},
    {kCmdDisplayOn, {0}, 0, 20},
};

struct DriverState {
  spi_device_handle_t device = nullptr;
  bool busReady = false;
  bool panelReady = false;
  uint8_t rotation = 1;
  uint16_t* dmaBuffers[2] = {nullptr, nullptr};
  spi_transaction_t transactions[2] = {};
};

DriverState sDriver;

uint16_t logicalWidth() {
  return (sDriver.rotation & 0x01U) ? AppConfig::kPanelHeight : AppConfig::kPanelWidth;
}

uint16_t logicalHeight() {
  return (sDriver.rotation & 0x01U) ? AppConfig::kPanelWidth : AppConfig::kPanelHeight;
}

void delayMs(uint32_t ms) { vTaskDelay(pdMS_TO_TICKS(ms)); }

bool setGpioOutput(int8_t pin, int level) {
  if (pin < 0) {
    return false;
  }
  gpio_config_t cfg = {};
  cfg.pin_bit_mask = 1ULL << static_cast<gpio_num_t>(pin);
  cfg.mode = GPIO_MODE_OUTPUT;
  cfg.pull_up_en = GPIO_PULLUP_DISABLE;
  cfg.pull_down_en = GPIO_PULLDOWN_DISABLE;
  cfg.intr_type = GPIO_INTR_DISABLE;
  if (gpio_config(&cfg) != ESP_OK) {
    return false;
  }
  return gpio_set_level(static_cast<gpio_num_t>(pin), level) == ESP_OK;
}

// D/C is driven from the transaction's user field so queued DMA transfers
// flip it at the right moment.
void IRAM_ATTR preTransfer(spi_transaction_t* t) {
  const int dc = static_cast<int>(reinterpret_cast<intptr_t>(t->user));
  gpio_set_level(static_cast<gpio_num_t>(AppConfig::kTftDcPin), dc);
}

bool transmit(int dc, const uint8_t* data, size_t size) {
  if (sDriver.device == nullptr || size == 0) {
    return sDriver.device != nullptr;
  }
  spi_transaction_t t = {};
  t.length = size * 8U;
  t.user = reinterpret_cast<void*>(static_cast<intptr_t>(dc));
  if (size <= 4) {
    t.flags = SPI_TRANS_USE_TXDATA;
    std::copy(data, data + size, t.tx_data);
  } else {
    t.tx_buffer = data;
  }
  return spi_device_polling_transmit(sDriver.device, &t) == ESP_OK;
}

bool writeCommand(uint8_t cmd) { return transmit(0, &cmd, 1); }

bool writeReg(uint8_t cmd, const uint8_t* data, size_t size) {
  return writeCommand(cmd) && transmit(1, data, size);
}

bool resetPanel() {
  if (AppConfig::kTftRstPin < 0) {
    return true;
  }
  // On the CYD the reset line is shared with MISO and must not be toggled.
  if (AppConfig::kTftRstPin == AppConfig::kTftMisoPin) {
    return true;
  }
  if (!setGpioOutput(AppConfig::kTftRstPin, 1)) {
    ESP_LOGW(kTag, "reset gpio setup failed pin=%d", AppConfig::kTftRstPin);
    return false;
  }
  gpio_set_level(static_cast<gpio_num_t>(AppConfig::kTftRstPin), 0);
  delayMs(20);
  gpio_set_level(static_cast<gpio_num_t>(AppConfig::kTftRstPin), 1);
  delayMs(120);
  return true;
}

bool runInitTable() {
  for (const InitCommand& c : kIli9341Init) {
    if (!writeReg(c.cmd, c.data, c.size)) {
      ESP_LOGE(kTag, "init cmd=0x%02x failed", c.cmd);
      return false;
    }
    if (c.delayMs > 0) {
      delayMs(c.delayMs);
    }
  }
  return true;
}

uint8_t madctlFor(uint8_t rotation, bool bgr) {
  static constexpr uint8_t kByRotation[] = {0x40, 0x20, 0x80, 0xE0};
  return static_cast<uint8_t>(kByRotation[rotation & 0x03U] | (bgr ? 0x08 : 0x00));
}

bool setWindow(uint16_t x0, uint16_t y0, uint16_t x1, uint16_t y1) {
  const uint8_t cols[] = {static_cast<uint8_t>(x0 >> 8), static_cast<uint8_t>(x0 & 0xFF),
                          static_cast<uint8_t>(x1 >> 8), static_cast<uint8_t>(x1 & 0xFF)};
  const uint8_t rows[] = {static_cast<uint8_t>(y0 >> 8), static_cast<uint8_t>(y0 & 0xFF),
                          static_cast<uint8_t>(y1 >> 8), static_cast<uint8_t>(y1 & 0xFF)};
  return writeReg(kCmdColumnAddr, cols, sizeof(cols)) &&
         writeReg(kCmdPageAddr, rows, sizeof(rows)) && writeCommand(kCmdMemoryWrite);
}

bool allocDmaBuffers() {
  for (uint16_t*& buf : sDriver.dmaBuffers) {
    if (buf == nullptr) {
      buf = static_cast<uint16_t*>(
          heap_caps_malloc(kChunkPixels * sizeof(uint16_t), MALLOC_CAP_DMA));
    }
    if (buf == nullptr) {
      ESP_LOGE(kTag, "dma buffer alloc failed bytes=%u",
               static_cast<unsigned>(kChunkPixels * sizeof(uint16_t)));
      return false;
    }
  }
  return true;
}

// Streams `count` pixels to the open RAMWR window. `source` may be null for a
// solid fill of `color`.
bool streamPixels(const uint16_t* source, uint16_t color, size_t count) {
  const uint16_t swapped = static_cast<uint16_t>((color >> 8) | (color << 8));
  size_t inFlight = 0;
  size_t slot = 0;
  size_t done = 0;
  bool ok = true;
  while (done < count && ok) {
    if (inFlight == 2) {
      spi_transaction_t* finished = nullptr;
      ok = spi_device_get_trans_result(sDriver.device, &finished, portMAX_DELAY) == ESP_OK;
      --inFlight;
      if (!ok) {
        break;
      }
    }
    const size_t n = std::min(kChunkPixels, count - done);
    uint16_t* buf = sDriver.dmaBuffers[slot];
    for (size_t i = 0; i < n; ++i) {
      const uint16_t c = source != nullptr ? source[done + i] : color;
      buf[i] = source != nullptr ? static_cast<uint16_t>((c >> 8) | (c << 8)) : swapped;
    }
    spi_transaction_t& t = sDriver.transactions[slot];
    t = spi_transaction_t();
    t.length = n * 16U;
    t.tx_buffer = buf;
    t.user = reinterpret_cast<void*>(static_cast<intptr_t>(1));
    ok = spi_device_queue_trans(sDriver.device, &t, portMAX_DELAY) == ESP_OK;
    if (ok) {
      ++inFlight;
      done += n;
      slot ^= 1U;
    }
  }
  while (inFlight > 0) {
    spi_transaction_t* finished = nullptr;
    if (spi_device_get_trans_result(sDriver.device, &finished, portMAX_DELAY) != ESP_OK) {
      ok = false;
    }
    --inFlight;
  }
  if (!ok) {
    ESP_LOGE(kTag, "pixel stream failed at %u/%u", static_cast<unsigned>(done),
             static_cast<unsigned>(count));
  }
  return ok;
}

}  // namespace

namespace display_spi {

bool init() {
  if (sDriver.device != nullptr) {
    return true;
  }

  if (!sDriver.busReady) {
    spi_bus_config_t busCfg = {};
    busCfg.mosi_io_num = AppConfig::kTftMosiPin;
    busCfg.miso_io_num = AppConfig::kTftMisoPin;
    busCfg.sclk_io_num = AppConfig::kTftSclkPin;
    busCfg.quadwp_io_num = -1;
    busCfg.quadhd_io_num = -1;
    busCfg.max_transfer_sz = static_cast<int>(kChunkPixels * sizeof(uint16_t));
    const esp_err_t busErr = spi_bus_initialize(kTftHost, &busCfg, SPI_DMA_CH_AUTO);
    if (busErr != ESP_OK) {
      ESP_LOGE(kTag, "spi bus init failed err=0x%x", static_cast<unsigned>(busErr));
      return false;
    }
    sDriver.busReady = true;
  }

  if (!setGpioOutput(AppConfig::kTftDcPin, 1)) {
    ESP_LOGE(kTag, "DC pin setup failed pin=%d", AppConfig::kTftDcPin);
    return false;
  }

  spi_device_interface_config_t devCfg = {};
  devCfg.clock_speed_hz = kPanelClockHz;
  devCfg.mode = 0;
  devCfg.spics_io_num = AppConfig::kTftCsPin;
  devCfg.queue_size = 2;
  devCfg.flags = SPI_DEVICE_NO_DUMMY;
  devCfg.pre_cb = preTransfer;
  const esp_err_t devErr = spi_bus_add_device(kTftHost, &devCfg, &sDriver.device);
  if (devErr != ESP_OK) {
    ESP_LOGE(kTag, "spi add device failed err=0x%x", static_cast<unsigned>(devErr));
    return false;
  }
  if (!allocDmaBuffers()) {
    return false;
  }
  ESP_LOGI(kTag, "spi ready cs=%d dc=%d hz=%d chunk_rows=%u", AppConfig::kTftCsPin,
           AppConfig::kTftDcPin, kPanelClockHz, static_cast<unsigned>(kRowsPerChunk));
  return true;
}

bool initPanel(const PanelOptions& options) {
  if (!init()) {
    return false;
  }
  (void)resetPanel();
  if (!runInitTable()) {
    return false;
  }
  sDriver.rotation = static_cast<uint8_t>(options.rotation & 0x03U);
  const uint8_t madctl = madctlFor(sDriver.rotation, options.bgr);
  if (!writeReg(kCmdMemoryAccess, &madctl, 1U) ||
      !writeCommand(options.invert ? kCmdInvertOn : kCmdInvertOff)) {
    ESP_LOGE(kTag, "panel orientation setup failed");
    return false;
  }
  sDriver.panelReady = true;
  ESP_LOGI(kTag, "panel ready %ux%u rot=%u madctl=0x%02x invert=%d",
           static_cast<unsigned>(logicalWidth()), static_cast<unsigned>(logicalHeight()),
           static_cast<unsigned>(sDriver.rotation), madctl, options.invert ? 1 : 0);
  return true;
}

bool clear(uint16_t color565) {
  if (!sDriver.panelReady) {
    return false;
  }
  const uint16_t w = logicalWidth();
  const uint16_t h = logicalHeight();
  return setWindow(0, 0, w - 1, h - 1) &&
         streamPixels(nullptr, color565, static_cast<size_t>(w) * h);
}

bool drawRows(uint16_t y, uint16_t rows, const uint16_t* pixels) {
  if (!sDriver.panelReady || pixels == nullptr || rows == 0) {
    return false;
  }
  const uint16_t w = logicalWidth();
  if (y >= logicalHeight()) {
    return false;
  }
  const uint16_t last = static_cast<uint16_t>(std::min<uint32_t>(y + rows, logicalHeight()) - 1U);
  return setWindow(0, y, w - 1, last) &&
         streamPixels(pixels, 0, static_cast<size_t>(w) * (last - y + 1U));
}

bool sleep() {
  if (!sDriver.panelReady) {
    return true;
  }
  // SLPIN needs 5 ms before the next command.
  const bool ok = writeCommand(kCmdDisplayOff) && writeCommand(kCmdSleepIn);
  delayMs(5);
  sDriver.panelReady = false;
  ESP_LOGI(kTag, "panel asleep ok=%d", ok ? 1 : 0);
  return ok;
}

uint16_t width() { return logicalWidth(); }

uint16_t height() { return logicalHeight(); }

}  // namespace display_spi
