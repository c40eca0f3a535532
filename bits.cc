#include "bits.hh"

/* lovingly lifted from RTKLIB */
unsigned int getbitu(const unsigned char *buff, int pos, int len)
{
  unsigned int bits=0;
  int i;
  for (i=pos;i<pos+len;i++) bits=(bits<<1)+((buff[i/8]>>(7-i%8))&1u);
  return bits;
}

int getbits(const unsigned char *buff, int pos, int len)
{
  unsigned int bits=getbitu(buff,pos,len);
  if (len<=0||32<=len||!(bits&(1u<<(len-1)))) return (int)bits;
  return (int)(bits|(~0u<<len)); /* extend sign */
}

void setbitu(unsigned char *buff, int pos, int len, unsigned int data)
{
  unsigned int mask=1u<<(len-1);
  int i;
  if (len<=0||32<len) return;
  for (i=pos;i<pos+len;i++,mask>>=1) {
    if (data&mask) buff[i/8]|=1u<<(7-i%8); else buff[i/8]&=~(1u<<(7-i%8));
  }
}

void setbits(unsigned char *buff, int pos, int len, int data)
{
  if (data<0) data|=1<<(len-1); else data&=~(1<<(len-1)); /* set sign bit */
  setbitu(buff,pos,len,(unsigned int)data);
}

// CRC-24Q as used by RTCM3, polynomial 0x1864CFB
unsigned int rtk_crc24q(const unsigned char *buff, int len)
{
  unsigned int crc=0;
  for(int i=0; i < len; ++i) {
    crc ^= ((unsigned int)buff[i]) << 16;
    for(int b=0; b < 8; ++b) {
      crc <<= 1;
      if(crc & 0x1000000)
        crc ^= 0x1864CFB;
    }
  }
  return crc & 0xFFFFFF;
}
