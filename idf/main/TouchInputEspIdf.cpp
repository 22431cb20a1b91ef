#include "TouchInputEspIdf.h"

#include "AppConfig.h"

#include "driver/gpio.h"
#include "driver/spi_master.h"
#include "esp_log.h"

#include <algorithm>
#include <cstdint>

namespace {
constexpr const char* kTag = "touch";
constexpr spi_host_device_t kTouchHost = SPI2_HOST;
constexpr int kTouchClockHz = 2500000;
constexpr uint8_t kMaxSamplesPerAxis = 9;

// Control bytes: start bit, channel, 12-bit differential mode, PD1:0 = 01
// (reference off, IRQ disabled between conversions) except the last, which
// powers down with PENIRQ enabled.
constexpr uint8_t kCmdZ1 = 0xB1;
constexpr uint8_t kCmdZ2 = 0xC1;
constexpr uint8_t kCmdX = 0xD1;
constexpr uint8_t kCmdY = 0x91;
constexpr uint8_t kCmdYPowerDown = 0x90;

// Z1, Z2, a discarded settling read, then X/Y pairs.
constexpr size_t kMaxCommands = 3 + 2 * kMaxSamplesPerAxis;
// One byte per command plus a 16-bit result slot after each; the next command
// is clocked out in the high byte of the previous result.
constexpr size_t kMaxFrameBytes = 1 + 2 * kMaxCommands;

struct TouchState {
  spi_device_handle_t device = nullptr;
  bool busReady = false;
  touch_input::Options options;
};

TouchState sTouch;

uint16_t median(uint16_t* values, size_t n) {
  std::nth_element(values, values + n / 2, values + n);
  return values[n / 2];
}

bool runConversions(const uint8_t* commands, size_t count, uint16_t* results) {
  uint8_t tx[kMaxFrameBytes] = {};
  uint8_t rx[kMaxFrameBytes] = {};
  tx[0] = commands[0];
  for (size_t i = 1; i < count; ++i) {
    tx[2 * i - 1] = commands[i];
  }
  const size_t frameBytes = 1 + 2 * count;

  spi_transaction_t t = {};
  t.length = frameBytes * 8U;
  t.tx_buffer = tx;
  t.rx_buffer = rx;
  if (spi_device_polling_transmit(sTouch.device, &t) != ESP_OK) {
    return false;
  }
  for (size_t i = 0; i < count; ++i) {
    results[i] = static_cast<uint16_t>(((rx[2 * i + 1] << 8) | rx[2 * i + 2]) >> 3) & 0x0FFFU;
  }
  return true;
}

}  // namespace

namespace touch_input {

bool init(const Options& options) {
  if (sTouch.device != nullptr) {
    return true;
  }
  sTouch.options = options;
  sTouch.options.samplesPerAxis =
      std::max<uint8_t>(1, std::min(options.samplesPerAxis, kMaxSamplesPerAxis));

  if (AppConfig::kTouchIrqPin >= 0) {
    gpio_config_t irqCfg = {};
    irqCfg.pin_bit_mask = 1ULL << static_cast<gpio_num_t>(AppConfig::kTouchIrqPin);
    irqCfg.mode = GPIO_MODE_INPUT;
    irqCfg.pull_up_en = GPIO_PULLUP_DISABLE;
    irqCfg.pull_down_en = GPIO_PULLDOWN_DISABLE;
    irqCfg.intr_type = GPIO_INTR_DISABLE;
    if (gpio_config(&irqCfg) != ESP_OK) {
      ESP_LOGW(kTag, "irq pin config failed pin=%d", AppConfig::kTouchIrqPin);
    }
  }

  if (!sTouch.busReady) {
    spi_bus_config_t busCfg = {};
    busCfg.sclk_io_num = AppConfig::kTouchSpiSckPin;
    busCfg.mosi_io_num = AppConfig::kTouchSpiMosiPin;
    busCfg.miso_io_num = AppConfig::kTouchSpiMisoPin;
    busCfg.quadwp_io_num = -1;
    busCfg.quadhd_io_num = -1;
    busCfg.max_transfer_sz = static_cast<int>(kMaxFrameBytes);
    const esp_err_t busErr = spi_bus_initialize(kTouchHost, &busCfg, SPI_DMA_DISABLED);
    if (busErr != ESP_OK) {
      ESP_LOGE(kTag, "spi bus init failed err=0x%x", static_cast<unsigned>(busErr));
      return false;
    }
    sTouch.busReady = true;
  }

  spi_device_interface_config_t devCfg = {};
  devCfg.clock_speed_hz = kTouchClockHz;
  devCfg.mode = 0;
  devCfg.spics_io_num = AppConfig::kTouchCsPin;
  devCfg.queue_size = 1;
  const esp_err_t devErr = spi_bus_add_device(kTouchHost, &devCfg, &sTouch.device);
  if (devErr != ESP_OK) {
    ESP_LOGE(kTag, "spi add device failed err=0x%x", static_cast<unsigned>(devErr));
    return false;
  }

  ESP_LOGI(kTag, "ready cs=%d irq=%d z_min=%u samples=%u", AppConfig::kTouchCsPin,
           AppConfig::kTouchIrqPin, static_cast<unsigned>(sTouch.options.pressureThreshold),
           static_cast<unsigned>(sTouch.options.samplesPerAxis));
  return true;
}

// PENIRQ is not trusted on every CYD revision, so every poll samples the
// controller.
ReadResult read(RawSample& out) {
  if (sTouch.device == nullptr) {
    return ReadResult::kBusError;
  }
  const size_t n = sTouch.options.samplesPerAxis;
  uint8_t commands[kMaxCommands];
  size_t count = 0;
  commands[count++] = kCmdZ1;
  commands[count++] = kCmdZ2;
  commands[count++] = kCmdY;
  for (size_t i = 0; i < n; ++i) {
    commands[count++] = kCmdX;
    commands[count++] = (i + 1 == n) ? kCmdYPowerDown : kCmdY;
  }

  uint16_t results[kMaxCommands];
  if (!runConversions(commands, count, results)) {
    return ReadResult::kBusError;
  }

  const int z = std::max(0, static_cast<int>(results[0]) + 4095 - static_cast<int>(results[1]));
  if (z < sTouch.options.pressureThreshold) {
    return ReadResult::kReleased;
  }

  uint16_t xs[kMaxSamplesPerAxis];
  uint16_t ys[kMaxSamplesPerAxis];
  for (size_t i = 0; i < n; ++i) {
    xs[i] = results[3 + 2 * i];
    ys[i] = results[4 + 2 * i];
  }
  const uint16_t x = median(xs, n);
  const uint16_t y = median(ys, n);

  // The controller is mounted rotated a quarter turn against the panel.
  out.rawX = y;
  out.rawY = static_cast<uint16_t>(4095U - x);
  out.z = static_cast<uint16_t>(std::min(z, 0xFFFF));
  return ReadResult::kPressed;
}

void release() {
  if (sTouch.device != nullptr) {
    const esp_err_t err = spi_bus_remove_device(sTouch.device);
    if (err != ESP_OK) {
      ESP_LOGW(kTag, "spi remove device failed err=0x%x", static_cast<unsigned>(err));
    }
    sTouch.device = nullptr;
  }
  if (sTouch.busReady && spi_bus_free(kTouchHost) == ESP_OK) {
    sTouch.busReady = false;
  }
  ESP_LOGI(kTag, "released");
}

}  // namespace touch_input
