#pragma once

#include <cstdint>

// RM690B0 command set (MIPI DCS plus vendor extensions)
namespace rm690b0::commands {

constexpr uint8_t NOP       = 0x00;
constexpr uint8_t SWRESET   = 0x01;
constexpr uint8_t RDDID     = 0x04; // read display identification
constexpr uint8_t RDNUMED   = 0x05; // read number of errors on DSI
constexpr uint8_t RDDPM     = 0x0A; // read display power mode
constexpr uint8_t RDDMADCTR = 0x0B;
constexpr uint8_t RDDCOLMOD = 0x0C;
constexpr uint8_t RDDIM     = 0x0D; // read display image mode
constexpr uint8_t RDDSM     = 0x0E; // read display signal mode
constexpr uint8_t RDDSDR    = 0x0F; // read self-diagnostic result
constexpr uint8_t SLPIN     = 0x10;
constexpr uint8_t SLPOUT    = 0x11;
constexpr uint8_t PTLON     = 0x12; // partial display mode on
constexpr uint8_t NORON     = 0x13; // normal display mode on
constexpr uint8_t INVOFF    = 0x20;
constexpr uint8_t INVON     = 0x21;
constexpr uint8_t ALLPOFF   = 0x22; // all pixels off
constexpr uint8_t ALLPON    = 0x23; // all pixels on
constexpr uint8_t DISPOFF   = 0x28;
constexpr uint8_t DISPON    = 0x29;
constexpr uint8_t CASET     = 0x2A; // column address set
constexpr uint8_t RASET     = 0x2B; // row address set
constexpr uint8_t RAMWR     = 0x2C; // memory write, starts a burst
constexpr uint8_t PTLAR     = 0x30; // partial area
constexpr uint8_t TEOFF     = 0x34;
constexpr uint8_t TEON      = 0x35;
constexpr uint8_t MADCTR    = 0x36; // memory data access control
constexpr uint8_t IDMOFF    = 0x38;
constexpr uint8_t IDMON     = 0x39;
constexpr uint8_t COLMOD    = 0x3A; // interface pixel format
constexpr uint8_t RAMWRC    = 0x3C; // memory continuous write
constexpr uint8_t STESL     = 0x44; // set tear scan line
constexpr uint8_t GSL       = 0x45; // get scan line
constexpr uint8_t DSTBON    = 0x4F; // deep standby on
constexpr uint8_t WRDISBV   = 0x51; // write display brightness
constexpr uint8_t RDDISBV   = 0x52;
constexpr uint8_t WRCTRLD   = 0x53;
constexpr uint8_t RDCTRLD   = 0x54;
constexpr uint8_t WRRADACL  = 0x55; // RAD_ACL control
constexpr uint8_t COLORTEMP = 0x55; // shares the address with WRRADACL
constexpr uint8_t WRHBM     = 0x63; // HBM brightness
constexpr uint8_t RDHBM     = 0x64;
constexpr uint8_t HBM_MODE  = 0x66;
constexpr uint8_t FR_LEVEL  = 0x67; // frame rate level
constexpr uint8_t COLSET    = 0x70;
constexpr uint8_t COLOPT    = 0x80;
constexpr uint8_t RDDDBS    = 0xA1;
constexpr uint8_t RDDDBC    = 0xA8;
constexpr uint8_t RDFCS     = 0xAA;
constexpr uint8_t RDCCS     = 0xAF;

// Vendor page select used by the manufacturer init block
constexpr uint8_t CMDMODE   = 0xFE;

} // namespace rm690b0::commands
