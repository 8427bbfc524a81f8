#include "ZlibInflate.h"
#include <cstring>

// ---------------------------------------------------------------------------
// Self-contained DEFLATE decompressor (RFC 1951)
// ---------------------------------------------------------------------------
namespace {

// Input is untrusted: every read is bounds checked and an overrun poisons the
// stream instead of producing zero bits.
struct BitStream
{
    const uint8_t* src;
    size_t len;
    size_t pos = 0;
    uint32_t buf = 0;
    int bits = 0;
    bool overrun = false;

    void fill()
    {
        while (bits <= 24 && pos < len)
        {
            buf |= static_cast<uint32_t>(src[pos++]) << bits;
            bits += 8;
        }
    }

    uint32_t read(int n)
    {
        if (n == 0) return 0;
        if (bits < n) fill();
        if (bits < n)
        {
            overrun = true;
            return 0;
        }
        uint32_t val = buf & ((1U << n) - 1);
        buf >>= n;
        bits -= n;
        return val;
    }

    // Drops the partial byte and hands buffered whole bytes back to the input.
    void align()
    {
        int discard = bits & 7;
        buf >>= discard;
        bits -= discard;
        pos -= static_cast<size_t>(bits / 8);
        buf = 0;
        bits = 0;
    }

    size_t bytesConsumed() const
    {
        return pos - static_cast<size_t>(bits / 8);
    }
};

constexpr int kMaxBits = 15;
constexpr int kMaxLitLenSyms = 288;
constexpr int kMaxDistSyms = 32;

struct HuffTable
{
    uint16_t counts[kMaxBits + 1] = {};
    uint16_t symbols[kMaxLitLenSyms] = {};
};

bool BuildHuff(HuffTable& t, const uint8_t* lengths, int num)
{
    std::memset(t.counts, 0, sizeof(t.counts));
    for (int i = 0; i < num; i++)
        t.counts[lengths[i]]++;
    t.counts[0] = 0;

    // Over-subscribed code sets cannot come from a real encoder.
    int left = 1;
    for (int len = 1; len <= kMaxBits; len++)
    {
        left <<= 1;
        left -= t.counts[len];
        if (left < 0) return false;
    }

    uint16_t offsets[kMaxBits + 1];
    offsets[0] = 0;
    offsets[1] = 0;
    for (int i = 1; i < kMaxBits; i++)
        offsets[i + 1] = offsets[i] + t.counts[i];

    for (int i = 0; i < num; i++)
        if (lengths[i])
            t.symbols[offsets[lengths[i]]++] = static_cast<uint16_t>(i);
    return true;
}

int DecodeSymbol(BitStream& bs, const HuffTable& t)
{
    bs.fill();
    int code = 0, first = 0, index = 0;
    for (int len = 1; len <= kMaxBits; len++)
    {
        if (bs.bits <= 0)
        {
            bs.overrun = true;
            return -1;
        }
        code |= (bs.buf & 1);
        bs.buf >>= 1;
        bs.bits--;
        int count = t.counts[len];
        if (code < first + count)
            return t.symbols[index + (code - first)];
        index += count;
        first = (first + count) << 1;
        code <<= 1;
    }
    return -1;
}

const uint16_t kLenBase[29] = {
    3,4,5,6,7,8,9,10,11,13,15,17,19,23,27,31,
    35,43,51,59,67,83,99,115,131,163,195,227,258
};
const uint8_t kLenExtra[29] = {
    0,0,0,0,0,0,0,0,1,1,1,1,2,2,2,2,3,3,3,3,4,4,4,4,5,5,5,5,0
};
const uint16_t kDistBase[30] = {
    1,2,3,4,5,7,9,13,17,25,33,49,65,97,129,193,
    257,385,513,769,1025,1537,2049,3073,4097,6145,8193,12289,16385,24577
};
const uint8_t kDistExtra[30] = {
    0,0,0,0,1,1,2,2,3,3,4,4,5,5,6,6,7,7,8,8,9,9,10,10,11,11,12,12,13,13
};

bool InflateBlocks(BitStream& bs, std::vector<uint8_t>& out, size_t maxOutput)
{
    int bfinal;
    do
    {
        bfinal = static_cast<int>(bs.read(1));
        int btype = static_cast<int>(bs.read(2));
        if (bs.overrun) return false;

        if (btype == 0) // stored
        {
            bs.align();
            if (bs.pos + 4 > bs.len) return false;
            uint16_t len = bs.src[bs.pos] | (bs.src[bs.pos + 1] << 8);
            uint16_t nlen = bs.src[bs.pos + 2] | (bs.src[bs.pos + 3] << 8);
            bs.pos += 4;
            if (static_cast<uint16_t>(~nlen) != len) return false;
            if (bs.pos + len > bs.len) return false;
            if (out.size() + len > maxOutput) return false;
            out.insert(out.end(), bs.src + bs.pos, bs.src + bs.pos + len);
            bs.pos += len;
        }
        else if (btype == 1 || btype == 2) // fixed or dynamic Huffman
        {
            HuffTable litLen, dist;

            if (btype == 1)
            {
                uint8_t lengths[kMaxLitLenSyms];
                int i = 0;
                for (; i < 144; i++) lengths[i] = 8;
                for (; i < 256; i++) lengths[i] = 9;
                for (; i < 280; i++) lengths[i] = 7;
                for (; i < 288; i++) lengths[i] = 8;
                BuildHuff(litLen, lengths, 288);

                // 30 and 31 are never emitted but keep the code complete
                uint8_t dlengths[kMaxDistSyms];
                for (i = 0; i < 32; i++) dlengths[i] = 5;
                BuildHuff(dist, dlengths, 32);
            }
            else
            {
                int hlit = static_cast<int>(bs.read(5)) + 257;
                int hdist = static_cast<int>(bs.read(5)) + 1;
                int hclen = static_cast<int>(bs.read(4)) + 4;
                if (bs.overrun || hlit > 286 || hdist > 30) return false;

                static const int kCodeOrder[19] = {
                    16,17,18,0,8,7,9,6,10,5,11,4,12,3,13,2,14,1,15
                };
                uint8_t clLengths[19] = {};
                for (int i = 0; i < hclen; i++)
                    clLengths[kCodeOrder[i]] = static_cast<uint8_t>(bs.read(3));

                HuffTable clTable;
                if (!BuildHuff(clTable, clLengths, 19)) return false;

                uint8_t lengths[kMaxLitLenSyms + kMaxDistSyms] = {};
                int total = hlit + hdist;
                for (int i = 0; i < total;)
                {
                    int sym = DecodeSymbol(bs, clTable);
                    if (sym < 0) return false;
                    if (sym < 16)
                    {
                        lengths[i++] = static_cast<uint8_t>(sym);
                    }
                    else if (sym == 16)
                    {
                        if (i == 0) return false;
                        int rep = static_cast<int>(bs.read(2)) + 3;
                        uint8_t prev = lengths[i - 1];
                        for (int j = 0; j < rep && i < total; j++)
                            lengths[i++] = prev;
                    }
                    else if (sym == 17)
                    {
                        int rep = static_cast<int>(bs.read(3)) + 3;
                        for (int j = 0; j < rep && i < total; j++)
                            lengths[i++] = 0;
                    }
                    else if (sym == 18)
                    {
                        int rep = static_cast<int>(bs.read(7)) + 11;
                        for (int j = 0; j < rep && i < total; j++)
                            lengths[i++] = 0;
                    }
                    else return false;
                }
                if (bs.overrun || lengths[256] == 0) return false;

                if (!BuildHuff(litLen, lengths, hlit)) return false;
                if (!BuildHuff(dist, lengths + hlit, hdist)) return false;
            }

            for (;;)
            {
                int sym = DecodeSymbol(bs, litLen);
                if (sym < 0) return false;
                if (sym < 256)
                {
                    if (out.size() >= maxOutput) return false;
                    out.push_back(static_cast<uint8_t>(sym));
                }
                else if (sym == 256)
                {
                    break;
                }
                else
                {
                    sym -= 257;
                    if (sym >= 29) return false;
                    int length = kLenBase[sym] + static_cast<int>(bs.read(kLenExtra[sym]));

                    int dsym = DecodeSymbol(bs, dist);
                    if (dsym < 0 || dsym >= 30) return false;
                    int distance = kDistBase[dsym] + static_cast<int>(bs.read(kDistExtra[dsym]));
                    if (bs.overrun) return false;

                    if (distance > static_cast<int>(out.size())) return false;
                    if (out.size() + length > maxOutput) return false;
                    size_t srcOff = out.size() - distance;
                    for (int j = 0; j < length; j++)
                        out.push_back(out[srcOff + j]);
                }
            }
        }
        else
        {
            return false;
        }
    } while (!bfinal);

    return !bs.overrun;
}

} // anonymous namespace

bool InflateRaw(const uint8_t* src, size_t srcLen, std::vector<uint8_t>& out,
                size_t& consumed, size_t maxOutput)
{
    out.clear();
    consumed = 0;

    BitStream bs;
    bs.src = src;
    bs.len = srcLen;

    if (!InflateBlocks(bs, out, maxOutput))
    {
        out.clear();
        return false;
    }

    consumed = bs.bytesConsumed();
    return true;
}

uint32_t Adler32(const uint8_t* data, size_t len)
{
    constexpr uint32_t kMod = 65521;
    uint32_t a = 1, b = 0;
    while (len > 0)
    {
        // 5552 is the largest block that cannot overflow b before the modulo
        size_t block = len < 5552 ? len : 5552;
        len -= block;
        while (block--)
        {
            a += *data++;
            b += a;
        }
        a %= kMod;
        b %= kMod;
    }
    return (b << 16) | a;
}

bool InflateZlib(const uint8_t* src, size_t srcLen, std::vector<uint8_t>& out,
                 size_t& streamLen)
{
    out.clear();
    streamLen = 0;
    if (srcLen < 2 + 4) return false;

    uint8_t cmf = src[0];
    uint8_t flg = src[1];
    if ((cmf & 0x0F) != 8) return false;             // deflate
    if ((cmf >> 4) > 7) return false;                // window up to 32K
    if (((cmf << 8) | flg) % 31 != 0) return false;
    if (flg & 0x20) return false;                    // preset dictionary

    size_t bodyLen = 0;
    if (!InflateRaw(src + 2, srcLen - 2, out, bodyLen))
        return false;

    size_t trailer = 2 + bodyLen;
    if (trailer + 4 > srcLen)
    {
        out.clear();
        return false;
    }

    uint32_t expected = (static_cast<uint32_t>(src[trailer]) << 24) |
        (static_cast<uint32_t>(src[trailer + 1]) << 16) |
        (static_cast<uint32_t>(src[trailer + 2]) << 8) |
        static_cast<uint32_t>(src[trailer + 3]);
    if (Adler32(out.data(), out.size()) != expected)
    {
        out.clear();
        return false;
    }

    streamLen = trailer + 4;
    return true;
}
